#include "QtPptxTemplate/SlideDeck.hpp"
#include <QRegularExpression>
#include <cmath>

namespace QtPptxTemplate {

namespace {

constexpr int kMaxTitleLength = 200;
constexpr int kMaxBulletLevel = 5;
constexpr double kMaxFontSize = 4000; // points; DrawingML sz tops out at 400000

bool validColor(const QString &c) {
    static const QRegularExpression re(QStringLiteral("^#[0-9A-Fa-f]{6}$"));
    return c.isEmpty() || re.match(c).hasMatch();
}

/** True when every character matches the XML 1.0 Char production. */
bool isXmlText(const QString &s) {
    for(qsizetype i = 0; i < s.size(); ++i) {
        const QChar ch = s.at(i);
        const char16_t u = ch.unicode();
        if(u < 0x20 && u != u'\t' && u != u'\n' && u != u'\r') return false;
        if(u == 0xFFFE || u == 0xFFFF) return false;
        if(ch.isHighSurrogate()) {
            if(i + 1 >= s.size() || !s.at(i + 1).isLowSurrogate()) return false;
            ++i;
        } else if(ch.isLowSurrogate()) {
            return false;
        }
    }
    return true;
}

bool checkString(const QString &s, const char *what, QString &reason) {
    if(isXmlText(s)) return true;
    reason = QStringLiteral("%1 contains characters not allowed in XML").arg(QLatin1String(what));
    return false;
}

bool checkFormatting(const std::optional<TextFormatting> &f, QString &reason) {
    if(!f) return true;
    if(!validColor(f->color)) { reason = QStringLiteral("invalid color '%1', expected #RRGGBB").arg(f->color); return false; }
    if(!(f->size == 0 || (f->size >= 1 && f->size <= kMaxFontSize))) {
        reason = QStringLiteral("font size %1 outside 1..%2 points").arg(f->size).arg(kMaxFontSize);
        return false;
    }
    return true;
}

bool checkBullets(const std::vector<BulletPoint> &bullets, QString &reason) {
    for(const auto &b : bullets) {
        if(b.level < 0 || b.level > kMaxBulletLevel) {
            reason = QStringLiteral("bullet level %1 outside 0..%2").arg(b.level).arg(kMaxBulletLevel);
            return false;
        }
        if(!checkString(b.text, "bullet text", reason)) return false;
        if(!checkFormatting(b.formatting, reason)) return false;
    }
    return true;
}

bool checkText(const TextBlock &t, QString &reason) {
    for(const auto &r : t.runs) {
        if(!checkString(r.text, "text run", reason) || !checkString(r.hyperlink, "hyperlink", reason)) return false;
        if(!checkFormatting(r.formatting, reason)) return false;
    }
    return checkBullets(t.bullets, reason);
}

bool checkTable(const TableData &t, QString &reason) {
    if(t.headers.isEmpty()) { reason = QStringLiteral("table has no header cells"); return false; }
    if(t.rows.empty()) { reason = QStringLiteral("table has no rows"); return false; }
    for(const auto &h : t.headers) if(!checkString(h, "table header", reason)) return false;
    for(size_t i = 0; i < t.rows.size(); ++i) {
        if(t.rows[i].size() != t.headers.size()) {
            reason = QStringLiteral("table row %1 has %2 cells, header has %3")
                         .arg(i).arg(t.rows[i].size()).arg(t.headers.size());
            return false;
        }
        for(const auto &cell : t.rows[i]) if(!checkString(cell, "table cell", reason)) return false;
    }
    return true;
}

bool checkChart(const ChartData &c, QString &reason) {
    if(c.categories.isEmpty()) { reason = QStringLiteral("chart has no categories"); return false; }
    if(c.series.empty()) { reason = QStringLiteral("chart has no series"); return false; }
    for(const auto &cat : c.categories) if(!checkString(cat, "chart category", reason)) return false;
    for(const auto &s : c.series) {
        if(!checkString(s.name, "chart series name", reason)) return false;
        if(static_cast<int>(s.values.size()) != c.categories.size()) {
            reason = QStringLiteral("chart series '%1' has %2 values for %3 categories")
                         .arg(s.name).arg(s.values.size()).arg(c.categories.size());
            return false;
        }
        for(double v : s.values) if(!std::isfinite(v)) { reason = QStringLiteral("chart series '%1' has a non-finite value").arg(s.name); return false; }
    }
    return true;
}

bool checkSlide(const Slide &slide, QString &reason) {
    if(slide.title().trimmed().isEmpty()) { reason = QStringLiteral("slide title is empty"); return false; }
    if(slide.title().size() > kMaxTitleLength) { reason = QStringLiteral("slide title longer than %1 characters").arg(kMaxTitleLength); return false; }
    if(!checkString(slide.title(), "slide title", reason)) return false;
    switch(slide.kind()) {
    case SlideKind::Title: {
        auto *s = dynamic_cast<const TitleSlide*>(&slide);
        if(!s) break;
        return checkString(s->subtitle(), "subtitle", reason);
    }
    case SlideKind::ContentOnly: {
        auto *s = dynamic_cast<const ContentSlide*>(&slide);
        if(!s) break;
        if(s->body().isEmpty()) { reason = QStringLiteral("content slide has no content or bullet points"); return false; }
        return checkText(s->body(), reason);
    }
    case SlideKind::ImageRight:
    case SlideKind::ImageLeft:
    case SlideKind::ImageFull: {
        auto *s = dynamic_cast<const ImageSlide*>(&slide);
        if(!s) break;
        if(s->image().query.trimmed().isEmpty()) { reason = QStringLiteral("image slide has an empty image query"); return false; }
        if(!checkString(s->image().query, "image query", reason)) return false;
        return checkText(s->body(), reason);
    }
    case SlideKind::Table: {
        auto *s = dynamic_cast<const TableSlide*>(&slide);
        if(!s) break;
        return checkTable(s->table(), reason) && checkText(s->body(), reason);
    }
    case SlideKind::Chart: {
        auto *s = dynamic_cast<const ChartSlide*>(&slide);
        if(!s) break;
        return checkChart(s->chart(), reason) && checkText(s->body(), reason);
    }
    case SlideKind::TwoColumns: {
        auto *s = dynamic_cast<const TwoColumnSlide*>(&slide);
        if(!s) break;
        if(s->left().empty() && s->right().empty()) { reason = QStringLiteral("two-column slide has both columns empty"); return false; }
        return checkBullets(s->left(), reason) && checkBullets(s->right(), reason);
    }
    }
    reason = QStringLiteral("slide kind '%1' does not match its payload").arg(slideKindKey(slide.kind()));
    return false;
}

} // namespace

std::optional<SlideDeck> SlideDeck::create(DeckProperties properties,
                                           std::vector<SlidePtr> slides,
                                           int declaredSlideCount,
                                           Error *error) {
    if(slides.empty()) { setError(error, ErrorCode::SchemaValidation, QStringLiteral("deck has no slides")); return std::nullopt; }
    if(declaredSlideCount < -1) {
        setError(error, ErrorCode::SchemaValidation, QStringLiteral("declared slide count %1 is negative").arg(declaredSlideCount));
        return std::nullopt;
    }
    if(declaredSlideCount >= 0 && declaredSlideCount != static_cast<int>(slides.size())) {
        setError(error, ErrorCode::SchemaValidation,
                 QStringLiteral("declared slide count %1 differs from %2 slides").arg(declaredSlideCount).arg(slides.size()));
        return std::nullopt;
    }
    if(properties.title.size() > kMaxTitleLength) {
        setError(error, ErrorCode::SchemaValidation, QStringLiteral("deck title longer than %1 characters").arg(kMaxTitleLength));
        return std::nullopt;
    }
    {
        QString reason;
        if(!checkString(properties.title, "deck title", reason) || !checkString(properties.subtitle, "deck subtitle", reason)
           || !checkString(properties.author, "author", reason) || !checkString(properties.subject, "subject", reason)
           || !checkString(properties.language, "language", reason)) {
            setError(error, ErrorCode::SchemaValidation, reason);
            return std::nullopt;
        }
    }
    if(properties.language.trimmed().isEmpty()) properties.language = QStringLiteral("en");
    for(size_t i = 0; i < slides.size(); ++i) {
        QString reason;
        if(!slides[i]) reason = QStringLiteral("null slide");
        else checkSlide(*slides[i], reason);
        if(!reason.isEmpty()) {
            setError(error, ErrorCode::SchemaValidation, reason, static_cast<int>(i));
            return std::nullopt;
        }
    }
    return SlideDeck(std::move(properties), std::move(slides));
}

} // namespace QtPptxTemplate
