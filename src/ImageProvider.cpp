#include "QtPptxTemplate/ImageProvider.hpp"
#include "QtPptxTemplate/LocalImageProvider.hpp"
#include "util/Logging.hpp"
#include <QBuffer>
#include <QColor>
#include <QDir>
#include <QFile>
#include <QImage>
#include <QImageReader>

namespace QtPptxTemplate {

namespace {
constexpr int kFallbackWidth = 1600;
constexpr int kFallbackHeight = 900;
}

DecodedImage decodeImage(const QByteArray &bytes) {
    DecodedImage out;
    if(bytes.isEmpty()) return out;
    QBuffer buffer;
    buffer.setData(bytes);
    if(!buffer.open(QIODevice::ReadOnly)) return out;
    QImageReader reader(&buffer);
    const QByteArray format = reader.format().toLower();
    const QImage image = reader.read();
    if(image.isNull()) return out;
    out.bytes = bytes;
    out.size = image.size();
    out.extension = format == "jpg" ? QStringLiteral("jpeg") : QString::fromLatin1(format);
    // Formats PowerPoint cannot embed are re-encoded.
    if(out.extension != QLatin1String("png") && out.extension != QLatin1String("jpeg") && out.extension != QLatin1String("gif")) {
        QByteArray png;
        QBuffer pngBuffer(&png);
        pngBuffer.open(QIODevice::WriteOnly);
        if(!image.save(&pngBuffer, "PNG")) return DecodedImage{};
        out.bytes = png;
        out.extension = QStringLiteral("png");
    }
    return out;
}

DecodedImage loadFallbackImage(const QString &path) {
    if(!path.isEmpty()) {
        QFile f(path);
        if(f.open(QIODevice::ReadOnly)) {
            DecodedImage img = decodeImage(f.readAll());
            if(!img.isNull()) return img;
        }
        qCWarning(lcImage, "Fallback image '%s' unusable, generating placeholder", qPrintable(path));
    }
    QImage grey(kFallbackWidth, kFallbackHeight, QImage::Format_RGB32);
    grey.fill(QColor(0xCC, 0xCC, 0xCC));
    QByteArray png;
    QBuffer buffer(&png);
    buffer.open(QIODevice::WriteOnly);
    if(!grey.save(&buffer, "PNG")) qCCritical(lcImage, "Cannot encode placeholder image");
    return DecodedImage{png, QStringLiteral("png"), grey.size()};
}

std::optional<ImagePayload> LocalImageProvider::fetch(const QString &query, std::chrono::milliseconds, const CancellationToken &cancel) {
    if(cancel.isCancelled()) return std::nullopt;
    const QString base = query.trimmed().replace(QLatin1Char(' '), QLatin1Char('_'));
    if(base.isEmpty()) return std::nullopt;
    const QDir dir(m_directory);
    const auto entries = dir.entryInfoList({base + QStringLiteral(".*")}, QDir::Files | QDir::Readable, QDir::Name | QDir::IgnoreCase);
    for(const auto &fi : entries) {
        QFile f(fi.filePath());
        if(!f.open(QIODevice::ReadOnly)) continue;
        const QString suffix = fi.suffix().toLower();
        const QString type = (suffix == QLatin1String("jpg")) ? QStringLiteral("image/jpeg") : QStringLiteral("image/") + suffix;
        qCDebug(lcImage, "Local image for '%s': %s", qPrintable(query), qPrintable(fi.fileName()));
        return ImagePayload{f.readAll(), type};
    }
    return std::nullopt;
}

} // namespace QtPptxTemplate
