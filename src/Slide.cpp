#include "QtPptxTemplate/Slide.hpp"
#include <QRegularExpression>

namespace QtPptxTemplate {

namespace {
struct KindNames { SlideKind kind; const char *name; const char *key; };
const KindNames kKindNames[] = {
    {SlideKind::Title, "Title Slide", "title_slide"},
    {SlideKind::ContentOnly, "Content Only", "content_only"},
    {SlideKind::ImageRight, "Image Right", "image_right"},
    {SlideKind::ImageLeft, "Image Left", "image_left"},
    {SlideKind::ImageFull, "Image Full", "image_full"},
    {SlideKind::Table, "Table", "table"},
    {SlideKind::Chart, "Chart", "chart"},
    {SlideKind::TwoColumns, "Two Columns", "two_columns"},
};

QString normalizeName(const QString &s) {
    static const QRegularExpression sep(QStringLiteral("[\\s_\\-]+"));
    return s.trimmed().toLower().replace(sep, QStringLiteral(" "));
}
} // namespace

QString slideKindName(SlideKind kind) {
    for(const auto &k : kKindNames) if(k.kind == kind) return QString::fromLatin1(k.name);
    return {};
}

QString slideKindKey(SlideKind kind) {
    for(const auto &k : kKindNames) if(k.kind == kind) return QString::fromLatin1(k.key);
    return {};
}

std::optional<SlideKind> slideKindFromString(const QString &text) {
    const QString n = normalizeName(text);
    if(n.isEmpty()) return std::nullopt;
    for(const auto &k : kKindNames) {
        if(n == normalizeName(QString::fromLatin1(k.name)) || n == normalizeName(QString::fromLatin1(k.key)))
            return k.kind;
    }
    if(n == QLatin1String("title")) return SlideKind::Title;
    return std::nullopt;
}

const std::vector<SlideKind> & allSlideKinds() {
    static const std::vector<SlideKind> kinds = {
        SlideKind::Title, SlideKind::ContentOnly, SlideKind::ImageRight, SlideKind::ImageLeft,
        SlideKind::ImageFull, SlideKind::Table, SlideKind::Chart, SlideKind::TwoColumns };
    return kinds;
}

int TextBlock::characterCount() const {
    int n = 0;
    for(const auto &r : runs) n += r.text.size();
    for(const auto &b : bullets) n += b.text.size();
    return n;
}

QString chartTypeName(ChartType type) {
    switch(type) {
    case ChartType::Bar: return QStringLiteral("bar");
    case ChartType::Line: return QStringLiteral("line");
    case ChartType::Pie: return QStringLiteral("pie");
    }
    return {};
}

std::optional<ChartType> chartTypeFromString(const QString &text) {
    const QString t = text.trimmed().toLower();
    if(t == QLatin1String("bar") || t == QLatin1String("column")) return ChartType::Bar;
    if(t == QLatin1String("line")) return ChartType::Line;
    if(t == QLatin1String("pie")) return ChartType::Pie;
    return std::nullopt;
}

} // namespace QtPptxTemplate
