#include "QtPptxTemplate/SlideDeck.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLocale>
#include <cmath>
#include <limits>

namespace QtPptxTemplate {

namespace {

/** Collects the first conversion failure; later failures are ignored. */
struct Reader {
    QString reason;
    int slideIndex{-1};
    bool ok() const { return reason.isEmpty(); }
    void fail(const QString &r) { if(reason.isEmpty()) reason = r; }
};

QString cellText(const QJsonValue &v, Reader &rd) {
    if(v.isString()) return v.toString();
    if(v.isDouble()) return QString::number(v.toDouble(), 'g', QLocale::FloatingPointShortest);
    if(v.isBool()) return v.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    rd.fail(QStringLiteral("table cell must be a string or a number"));
    return {};
}

std::optional<TextFormatting> readFormatting(const QJsonValue &v, Reader &rd) {
    if(v.isUndefined() || v.isNull()) return std::nullopt;
    if(!v.isObject()) { rd.fail(QStringLiteral("formatting must be an object")); return std::nullopt; }
    const QJsonObject o = v.toObject();
    TextFormatting f;
    f.bold = o.value(QLatin1String("bold")).toBool(false);
    f.italic = o.value(QLatin1String("italic")).toBool(false);
    f.color = o.value(QLatin1String("color")).toString();
    f.size = o.value(QLatin1String("size")).toDouble(0);
    return f;
}

std::vector<TextRun> readRuns(const QJsonValue &content, Reader &rd) {
    std::vector<TextRun> runs;
    QJsonValue v = content;
    if(v.isObject() && v.toObject().contains(QLatin1String("runs"))) v = v.toObject().value(QLatin1String("runs"));
    if(v.isUndefined() || v.isNull()) return runs;
    if(v.isString()) {
        if(!v.toString().isEmpty()) runs.push_back(TextRun{v.toString(), std::nullopt, QString()});
        return runs;
    }
    if(!v.isArray()) { rd.fail(QStringLiteral("content must be a string or a list of text runs")); return runs; }
    for(const auto &item : v.toArray()) {
        if(item.isString()) { runs.push_back(TextRun{item.toString(), std::nullopt, QString()}); continue; }
        if(!item.isObject()) { rd.fail(QStringLiteral("text run must be an object")); return runs; }
        const QJsonObject o = item.toObject();
        if(!o.value(QLatin1String("text")).isString()) { rd.fail(QStringLiteral("text run without text")); return runs; }
        runs.push_back(TextRun{o.value(QLatin1String("text")).toString(),
                               readFormatting(o.value(QLatin1String("formatting")), rd),
                               o.value(QLatin1String("hyperlink")).toString()});
    }
    return runs;
}

std::vector<BulletPoint> readBullets(const QJsonValue &v, Reader &rd) {
    std::vector<BulletPoint> out;
    if(v.isUndefined() || v.isNull()) return out;
    if(!v.isArray()) { rd.fail(QStringLiteral("bullet list must be an array")); return out; }
    for(const auto &item : v.toArray()) {
        if(item.isString()) { out.push_back(BulletPoint{item.toString(), 0, std::nullopt}); continue; }
        if(!item.isObject() || !item.toObject().value(QLatin1String("text")).isString()) {
            rd.fail(QStringLiteral("bullet point must be a string or an object with text"));
            return out;
        }
        const QJsonObject o = item.toObject();
        out.push_back(BulletPoint{o.value(QLatin1String("text")).toString(),
                                  o.value(QLatin1String("level")).toInt(0),
                                  readFormatting(o.value(QLatin1String("formatting")), rd)});
    }
    return out;
}

TextBlock readBody(const QJsonObject &o, Reader &rd) {
    TextBlock body;
    body.runs = readRuns(o.value(QLatin1String("content")), rd);
    body.bullets = readBullets(o.value(QLatin1String("bullet_points")), rd);
    return body;
}

TableData readTable(const QJsonValue &v, Reader &rd) {
    TableData t;
    if(!v.isObject()) { rd.fail(QStringLiteral("table must be an object")); return t; }
    const QJsonObject o = v.toObject();
    for(const auto &h : o.value(QLatin1String("headers")).toArray()) t.headers << cellText(h, rd);
    for(const auto &r : o.value(QLatin1String("rows")).toArray()) {
        if(!r.isArray()) { rd.fail(QStringLiteral("table row must be an array")); return t; }
        QStringList row;
        for(const auto &c : r.toArray()) row << cellText(c, rd);
        t.rows.push_back(row);
    }
    t.style = o.value(QLatin1String("style")).toString();
    return t;
}

ChartData readChart(const QJsonValue &v, ChartType defaultType, Reader &rd) {
    ChartData c;
    c.type = defaultType;
    if(!v.isObject()) { rd.fail(QStringLiteral("chart must be an object")); return c; }
    const QJsonObject o = v.toObject();
    const QJsonValue type = o.value(QLatin1String("type"));
    if(type.isString()) {
        auto t = chartTypeFromString(type.toString());
        if(!t) { rd.fail(QStringLiteral("unsupported chart type '%1'").arg(type.toString())); return c; }
        c.type = *t;
    }
    for(const auto &cat : o.value(QLatin1String("categories")).toArray()) c.categories << cellText(cat, rd);
    for(const auto &s : o.value(QLatin1String("series")).toArray()) {
        const QJsonObject so = s.toObject();
        ChartSeries series;
        series.name = so.value(QLatin1String("name")).toString();
        QJsonValue data = so.value(QLatin1String("data"));
        if(data.isUndefined()) data = so.value(QLatin1String("values"));
        for(const auto &d : data.toArray()) {
            if(!d.isDouble()) { rd.fail(QStringLiteral("chart series '%1' has a non-numeric value").arg(series.name)); return c; }
            series.values.push_back(d.toDouble());
        }
        c.series.push_back(series);
    }
    return c;
}

/** Explicit kind first, then content-based detection: chart, table, image, layout hint. */
std::optional<SlideKind> detectKind(const QJsonObject &o, Reader &rd) {
    for(const char *key : {"kind", "type"}) {
        const QJsonValue k = o.value(QLatin1String(key));
        if(k.isString()) {
            auto kind = slideKindFromString(k.toString());
            if(!kind) rd.fail(QStringLiteral("unknown slide kind '%1'").arg(k.toString()));
            return kind;
        }
    }
    if(o.contains(QLatin1String("chart"))) return SlideKind::Chart;
    if(o.contains(QLatin1String("table"))) return SlideKind::Table;
    if(o.value(QLatin1String("image")).isObject()) {
        const QString pos = o.value(QLatin1String("image")).toObject().value(QLatin1String("position")).toString(QStringLiteral("right"));
        if(pos == QLatin1String("left")) return SlideKind::ImageLeft;
        if(pos == QLatin1String("full")) return SlideKind::ImageFull;
        return SlideKind::ImageRight;
    }
    const QJsonValue hint = o.value(QLatin1String("layout"));
    if(hint.isString()) {
        if(auto kind = slideKindFromString(hint.toString())) return kind;
    }
    if(o.contains(QLatin1String("left")) || o.contains(QLatin1String("right"))) return SlideKind::TwoColumns;
    return SlideKind::ContentOnly;
}

SlidePtr readSlide(const QJsonObject &o, ChartType defaultChart, Reader &rd) {
    auto kind = detectKind(o, rd);
    if(!kind) return nullptr;
    const QString title = o.value(QLatin1String("title")).toString();
    switch(*kind) {
    case SlideKind::Title:
        return std::make_shared<TitleSlide>(title, o.value(QLatin1String("subtitle")).toString());
    case SlideKind::ContentOnly:
        return std::make_shared<ContentSlide>(title, readBody(o, rd));
    case SlideKind::ImageRight:
    case SlideKind::ImageLeft:
    case SlideKind::ImageFull: {
        const QJsonObject img = o.value(QLatin1String("image")).toObject();
        ImageDescriptor d;
        d.query = img.value(QLatin1String("query")).toString(img.value(QLatin1String("path")).toString());
        d.fallbackPath = img.value(QLatin1String("fallback")).toString();
        if(d.query.isEmpty()) d.query = title;
        return std::make_shared<ImageSlide>(*kind, title, d, readBody(o, rd));
    }
    case SlideKind::Table:
        return std::make_shared<TableSlide>(title, readTable(o.value(QLatin1String("table")), rd), readBody(o, rd));
    case SlideKind::Chart:
        return std::make_shared<ChartSlide>(title, readChart(o.value(QLatin1String("chart")), defaultChart, rd), readBody(o, rd));
    case SlideKind::TwoColumns: {
        std::vector<BulletPoint> left = readBullets(o.value(QLatin1String("left")), rd);
        std::vector<BulletPoint> right = readBullets(o.value(QLatin1String("right")), rd);
        const QJsonArray cols = o.value(QLatin1String("columns")).toArray();
        if(left.empty() && right.empty() && cols.size() == 2) {
            left = readBullets(cols.at(0), rd);
            right = readBullets(cols.at(1), rd);
        }
        return std::make_shared<TwoColumnSlide>(title, left, right);
    }
    }
    return nullptr;
}

QJsonObject formattingJson(const TextFormatting &f) {
    QJsonObject o;
    if(f.bold) o.insert(QLatin1String("bold"), true);
    if(f.italic) o.insert(QLatin1String("italic"), true);
    if(!f.color.isEmpty()) o.insert(QLatin1String("color"), f.color);
    if(f.size > 0) o.insert(QLatin1String("size"), f.size);
    return o;
}

QJsonArray bulletsJson(const std::vector<BulletPoint> &bullets) {
    QJsonArray a;
    for(const auto &b : bullets) {
        QJsonObject o{{QLatin1String("text"), b.text}, {QLatin1String("level"), b.level}};
        if(b.formatting) o.insert(QLatin1String("formatting"), formattingJson(*b.formatting));
        a.append(o);
    }
    return a;
}

void writeBody(QJsonObject &o, const TextBlock &body) {
    if(!body.runs.empty()) {
        QJsonArray runs;
        for(const auto &r : body.runs) {
            QJsonObject ro{{QLatin1String("text"), r.text}};
            if(r.formatting) ro.insert(QLatin1String("formatting"), formattingJson(*r.formatting));
            if(!r.hyperlink.isEmpty()) ro.insert(QLatin1String("hyperlink"), r.hyperlink);
            runs.append(ro);
        }
        o.insert(QLatin1String("content"), runs);
    }
    if(!body.bullets.empty()) o.insert(QLatin1String("bullet_points"), bulletsJson(body.bullets));
}

} // namespace

std::optional<SlideDeck> SlideDeck::fromJson(const QByteArray &json, Error *error, ChartType defaultChartType) {
    QJsonParseError pe;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &pe);
    if(pe.error != QJsonParseError::NoError) {
        setError(error, ErrorCode::SchemaValidation, QStringLiteral("invalid JSON at offset %1: %2").arg(pe.offset).arg(pe.errorString()));
        return std::nullopt;
    }
    if(!doc.isObject()) { setError(error, ErrorCode::SchemaValidation, QStringLiteral("deck must be a JSON object")); return std::nullopt; }
    const QJsonObject root = doc.object();

    DeckProperties props;
    props.title = root.value(QLatin1String("title")).toString();
    props.subtitle = root.value(QLatin1String("subtitle")).toString();
    props.author = root.value(QLatin1String("author")).toString();
    props.subject = root.value(QLatin1String("subject")).toString();
    props.language = root.value(QLatin1String("language")).toString(QStringLiteral("en"));
    if(props.title.trimmed().isEmpty()) { setError(error, ErrorCode::SchemaValidation, QStringLiteral("deck title is required")); return std::nullopt; }

    const QJsonValue slidesValue = root.value(QLatin1String("slides"));
    if(!slidesValue.isArray()) { setError(error, ErrorCode::SchemaValidation, QStringLiteral("'slides' must be an array")); return std::nullopt; }

    int declared = -1;
    const QJsonValue count = root.value(QLatin1String("slide_count"));
    if(!count.isUndefined() && !count.isNull()) {
        const double d = count.toDouble(-1);
        if(!count.isDouble() || d < 0 || d > std::numeric_limits<int>::max() || d != std::floor(d)) {
            setError(error, ErrorCode::SchemaValidation, QStringLiteral("'slide_count' must be a non-negative integer"));
            return std::nullopt;
        }
        declared = static_cast<int>(d);
    }

    std::vector<SlidePtr> slides;
    const QJsonArray arr = slidesValue.toArray();
    for(int i = 0; i < arr.size(); ++i) {
        Reader rd;
        if(!arr.at(i).isObject()) rd.fail(QStringLiteral("slide must be an object"));
        SlidePtr s = rd.ok() ? readSlide(arr.at(i).toObject(), defaultChartType, rd) : nullptr;
        if(!rd.ok() || !s) {
            setError(error, ErrorCode::SchemaValidation, rd.reason.isEmpty() ? QStringLiteral("unreadable slide") : rd.reason, i);
            return std::nullopt;
        }
        slides.push_back(std::move(s));
    }
    return create(std::move(props), std::move(slides), declared, error);
}

QJsonObject SlideDeck::toJson() const {
    QJsonObject root;
    root.insert(QLatin1String("title"), m_properties.title);
    if(!m_properties.subtitle.isEmpty()) root.insert(QLatin1String("subtitle"), m_properties.subtitle);
    if(!m_properties.author.isEmpty()) root.insert(QLatin1String("author"), m_properties.author);
    if(!m_properties.subject.isEmpty()) root.insert(QLatin1String("subject"), m_properties.subject);
    root.insert(QLatin1String("language"), m_properties.language);
    root.insert(QLatin1String("slide_count"), slideCount());
    QJsonArray slides;
    for(const auto &sp : m_slides) {
        QJsonObject o{{QLatin1String("kind"), slideKindKey(sp->kind())}, {QLatin1String("title"), sp->title()}};
        switch(sp->kind()) {
        case SlideKind::Title:
            o.insert(QLatin1String("subtitle"), static_cast<const TitleSlide&>(*sp).subtitle());
            break;
        case SlideKind::ContentOnly:
            writeBody(o, static_cast<const ContentSlide&>(*sp).body());
            break;
        case SlideKind::ImageRight:
        case SlideKind::ImageLeft:
        case SlideKind::ImageFull: {
            const auto &s = static_cast<const ImageSlide&>(*sp);
            QJsonObject img{{QLatin1String("query"), s.image().query}};
            if(!s.image().fallbackPath.isEmpty()) img.insert(QLatin1String("fallback"), s.image().fallbackPath);
            o.insert(QLatin1String("image"), img);
            writeBody(o, s.body());
            break;
        }
        case SlideKind::Table: {
            const auto &t = static_cast<const TableSlide&>(*sp).table();
            QJsonArray rows;
            for(const auto &r : t.rows) rows.append(QJsonArray::fromStringList(r));
            QJsonObject to{{QLatin1String("headers"), QJsonArray::fromStringList(t.headers)}, {QLatin1String("rows"), rows}};
            if(!t.style.isEmpty()) to.insert(QLatin1String("style"), t.style);
            o.insert(QLatin1String("table"), to);
            writeBody(o, static_cast<const TableSlide&>(*sp).body());
            break;
        }
        case SlideKind::Chart: {
            const auto &c = static_cast<const ChartSlide&>(*sp).chart();
            QJsonArray series;
            for(const auto &s : c.series) {
                QJsonArray data;
                for(double v : s.values) data.append(v);
                series.append(QJsonObject{{QLatin1String("name"), s.name}, {QLatin1String("data"), data}});
            }
            o.insert(QLatin1String("chart"), QJsonObject{{QLatin1String("type"), chartTypeName(c.type)},
                                                         {QLatin1String("categories"), QJsonArray::fromStringList(c.categories)},
                                                         {QLatin1String("series"), series}});
            writeBody(o, static_cast<const ChartSlide&>(*sp).body());
            break;
        }
        case SlideKind::TwoColumns: {
            const auto &s = static_cast<const TwoColumnSlide&>(*sp);
            o.insert(QLatin1String("left"), bulletsJson(s.left()));
            o.insert(QLatin1String("right"), bulletsJson(s.right()));
            break;
        }
        }
        slides.append(o);
    }
    root.insert(QLatin1String("slides"), slides);
    return root;
}

} // namespace QtPptxTemplate
