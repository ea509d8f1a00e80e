#include "QtPptxTemplate/RenderedDeck.hpp"
#include "util/Logging.hpp"
#include <QJsonArray>
#include <QSaveFile>

namespace QtPptxTemplate {

QString imageSourceName(ImageSource source) {
    switch(source) {
    case ImageSource::Provider: return QStringLiteral("provider");
    case ImageSource::LocalFile: return QStringLiteral("local");
    case ImageSource::Fallback: return QStringLiteral("fallback");
    }
    return QString();
}

bool RenderedDeck::isDegraded(int slideIndex) const {
    for(const auto &d : degradedSlides) if(d.slideIndex == slideIndex) return true;
    return false;
}

QJsonObject RenderedDeck::metadata() const {
    QJsonArray degraded;
    for(const auto &d : degradedSlides)
        degraded.append(QJsonObject{{QStringLiteral("index"), d.slideIndex},
                                    {QStringLiteral("requested_kind"), slideKindKey(d.requestedKind)}});
    QJsonArray imgs;
    for(const auto &i : images)
        imgs.append(QJsonObject{{QStringLiteral("index"), i.slideIndex},
                                {QStringLiteral("query"), i.query},
                                {QStringLiteral("source"), imageSourceName(i.source)}});
    return QJsonObject{{QStringLiteral("filename"), filename},
                       {QStringLiteral("slide_count"), slideCount},
                       {QStringLiteral("degraded_slides"), degraded},
                       {QStringLiteral("images"), imgs},
                       {QStringLiteral("structure"), structure}};
}

bool RenderedDeck::save(const QString &path) const {
    QSaveFile f(path);
    if(!f.open(QIODevice::WriteOnly)) {
        qCWarning(lcPackage, "Cannot open %s: %s", qPrintable(path), qPrintable(f.errorString()));
        return false;
    }
    if(f.write(package) != package.size()) {
        qCWarning(lcPackage, "Cannot write %s: %s", qPrintable(path), qPrintable(f.errorString()));
        f.cancelWriting();
        return false;
    }
    return f.commit();
}

QString sanitizeFilename(const QString &hint) {
    QString out;
    for(const QChar ch : hint) {
        if(ch.isLetterOrNumber() || ch == QLatin1Char(' ') || ch == QLatin1Char('-') || ch == QLatin1Char('_') || ch == QLatin1Char('.'))
            out.append(ch);
    }
    out = out.trimmed();
    if(out.endsWith(QLatin1String(".pptx"), Qt::CaseInsensitive)) out.chop(5);
    while(out.startsWith(QLatin1Char('.'))) out.remove(0, 1);
    if(out.isEmpty()) out = QStringLiteral("presentation");
    return out + QStringLiteral(".pptx");
}

} // namespace QtPptxTemplate
