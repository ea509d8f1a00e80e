#include "QtPptxTemplate/Builder.hpp"
#include <utility>

namespace QtPptxTemplate {

std::vector<BulletPoint> makeBullets(const QStringList &items){
    std::vector<BulletPoint> out; out.reserve(static_cast<size_t>(items.size()));
    for(const auto &t : items) out.push_back(BulletPoint{t, 0, std::nullopt});
    return out;
}

SlidePtr makeTitleSlide(const QString &headline, const QString &subtitle){
    return std::make_shared<TitleSlide>(headline, subtitle);
}

SlidePtr makeContentSlide(const QString &title, const QString &text){
    return std::make_shared<ContentSlide>(title, textBlock(text));
}

SlidePtr makeContentSlide(const QString &title, const QString &text, const QStringList &bullets){
    TextBlock body = text.isEmpty() ? TextBlock{} : textBlock(text);
    body.bullets = makeBullets(bullets);
    return std::make_shared<ContentSlide>(title, std::move(body));
}

SlidePtr makeImageSlide(SlideKind kind, const QString &title, const QString &query, const QString &text, const QString &fallbackPath){
    return std::make_shared<ImageSlide>(kind, title, ImageDescriptor{query, fallbackPath},
                                        text.isEmpty() ? TextBlock{} : textBlock(text));
}

SlidePtr makeTableSlide(const QString &title, const QStringList &headers, std::initializer_list<QStringList> rows, const QString &style){
    return makeTableSlide(title, headers, std::vector<QStringList>(rows), style);
}

SlidePtr makeTableSlide(const QString &title, const QStringList &headers, const std::vector<QStringList> &rows, const QString &style){
    TableData t;
    t.headers = headers;
    t.rows = rows;
    t.style = style;
    return std::make_shared<TableSlide>(title, std::move(t));
}

SlidePtr makeChartSlide(const QString &title, ChartType type, const QStringList &categories, std::initializer_list<SeriesSpec> series, const QString &text){
    ChartData c;
    c.type = type;
    c.categories = categories;
    for(const auto &s : series) c.series.push_back(ChartSeries{s.name, s.values});
    return std::make_shared<ChartSlide>(title, std::move(c), text.isEmpty() ? TextBlock{} : textBlock(text));
}

SlidePtr makeTwoColumnSlide(const QString &title, const QStringList &left, const QStringList &right){
    return std::make_shared<TwoColumnSlide>(title, makeBullets(left), makeBullets(right));
}

} // namespace QtPptxTemplate
