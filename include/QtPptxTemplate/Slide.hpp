/** \file Slide.hpp
 *  Typed slide descriptions. Each slide kind carries only the fields meaningful to it.
 *  Slides are immutable once constructed; structural consistency (table rows, chart series)
 *  is checked when they are gathered into a SlideDeck.
 */
#pragma once
#include "QtPptxTemplate/Export.hpp"
#include <QString>
#include <QStringList>
#include <memory>
#include <optional>
#include <vector>

namespace QtPptxTemplate {

enum class SlideKind { Title, ContentOnly, ImageRight, ImageLeft, ImageFull, Table, Chart, TwoColumns };

/** Layout display name expected in templates ("Title Slide", "Content Only", ...). */
QTPPTXTEMPLATE_EXPORT QString slideKindName(SlideKind kind);
/** Snake-case key used in JSON ("title_slide", "content_only", ...). */
QTPPTXTEMPLATE_EXPORT QString slideKindKey(SlideKind kind);
/** Case-insensitive, whitespace/underscore-normalized match against names and keys. */
QTPPTXTEMPLATE_EXPORT std::optional<SlideKind> slideKindFromString(const QString &text);
QTPPTXTEMPLATE_EXPORT const std::vector<SlideKind> & allSlideKinds();

struct TextFormatting {
    bool bold{false};
    bool italic{false};
    QString color;   // "#RRGGBB" or empty
    double size{0};  // points, 0 = inherit
};

struct TextRun {
    QString text;
    std::optional<TextFormatting> formatting;
    QString hyperlink;
};

struct BulletPoint {
    QString text;
    int level{0}; // 0..5
    std::optional<TextFormatting> formatting;
};

/** Body text: an optional paragraph of runs followed by bullet points. */
struct TextBlock {
    std::vector<TextRun> runs;
    std::vector<BulletPoint> bullets;
    bool isEmpty() const { return runs.empty() && bullets.empty(); }
    int characterCount() const;
};

struct TableData {
    QStringList headers;
    std::vector<QStringList> rows;
    QString style; // "header_colored" or empty
    int columnCount() const { return headers.size(); }
};

enum class ChartType { Bar, Line, Pie };
QTPPTXTEMPLATE_EXPORT QString chartTypeName(ChartType type);
/** Accepts bar/column/line/pie (case-insensitive). */
QTPPTXTEMPLATE_EXPORT std::optional<ChartType> chartTypeFromString(const QString &text);

struct ChartSeries {
    QString name;
    std::vector<double> values;
};

struct ChartData {
    ChartType type{ChartType::Bar};
    QStringList categories;
    std::vector<ChartSeries> series;
};

/** Image request: a topic query plus the resource used when the provider yields nothing. */
struct ImageDescriptor {
    QString query;
    QString fallbackPath; // empty = configured default fallback
};

/** Base of all slide descriptions; kind() tells which subclass to cast to. */
class QTPPTXTEMPLATE_EXPORT Slide {
public:
    virtual ~Slide() = default;
    SlideKind kind() const { return m_kind; }
    const QString & title() const { return m_title; }
protected:
    Slide(SlideKind kind, QString title) : m_kind(kind), m_title(std::move(title)) {}
private:
    SlideKind m_kind;
    QString m_title;
};
using SlidePtr = std::shared_ptr<const Slide>;

class QTPPTXTEMPLATE_EXPORT TitleSlide : public Slide {
public:
    TitleSlide(QString headline, QString subtitle)
        : Slide(SlideKind::Title, std::move(headline)), m_subtitle(std::move(subtitle)) {}
    const QString & subtitle() const { return m_subtitle; }
private:
    QString m_subtitle;
};

class QTPPTXTEMPLATE_EXPORT ContentSlide : public Slide {
public:
    ContentSlide(QString title, TextBlock body)
        : Slide(SlideKind::ContentOnly, std::move(title)), m_body(std::move(body)) {}
    const TextBlock & body() const { return m_body; }
private:
    TextBlock m_body;
};

/** ImageRight, ImageLeft or ImageFull. Body text is optional. */
class QTPPTXTEMPLATE_EXPORT ImageSlide : public Slide {
public:
    ImageSlide(SlideKind kind, QString title, ImageDescriptor image, TextBlock body = {})
        : Slide(kind, std::move(title)), m_image(std::move(image)), m_body(std::move(body)) {}
    const ImageDescriptor & image() const { return m_image; }
    const TextBlock & body() const { return m_body; }
private:
    ImageDescriptor m_image;
    TextBlock m_body;
};

/** Body text is optional and goes next to the table. */
class QTPPTXTEMPLATE_EXPORT TableSlide : public Slide {
public:
    TableSlide(QString title, TableData table, TextBlock body = {})
        : Slide(SlideKind::Table, std::move(title)), m_table(std::move(table)), m_body(std::move(body)) {}
    const TableData & table() const { return m_table; }
    const TextBlock & body() const { return m_body; }
private:
    TableData m_table;
    TextBlock m_body;
};

class QTPPTXTEMPLATE_EXPORT ChartSlide : public Slide {
public:
    ChartSlide(QString title, ChartData chart, TextBlock body = {})
        : Slide(SlideKind::Chart, std::move(title)), m_chart(std::move(chart)), m_body(std::move(body)) {}
    const ChartData & chart() const { return m_chart; }
    const TextBlock & body() const { return m_body; }
private:
    ChartData m_chart;
    TextBlock m_body;
};

class QTPPTXTEMPLATE_EXPORT TwoColumnSlide : public Slide {
public:
    TwoColumnSlide(QString title, std::vector<BulletPoint> left, std::vector<BulletPoint> right)
        : Slide(SlideKind::TwoColumns, std::move(title)), m_left(std::move(left)), m_right(std::move(right)) {}
    const std::vector<BulletPoint> & left() const { return m_left; }
    const std::vector<BulletPoint> & right() const { return m_right; }
private:
    std::vector<BulletPoint> m_left;
    std::vector<BulletPoint> m_right;
};

/** True for ImageRight/ImageLeft/ImageFull. */
inline bool isImageKind(SlideKind k) {
    return k == SlideKind::ImageRight || k == SlideKind::ImageLeft || k == SlideKind::ImageFull;
}

} // namespace QtPptxTemplate
