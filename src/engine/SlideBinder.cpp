#include "engine/SlideBinder.hpp"
#include "engine/ChartBinder.hpp"
#include "engine/ImageBinder.hpp"
#include "engine/TableBinder.hpp"
#include "engine/TextBinder.hpp"
#include "util/Logging.hpp"

namespace QtPptxTemplate { namespace engine {

std::pair<Rect, Rect> splitHorizontally(const Rect &r) {
    const qint64 gutter = r.cx / 50;
    const qint64 half = (r.cx - gutter) / 2;
    return {Rect{r.x, r.y, half, r.cy}, Rect{r.x + half + gutter, r.y, r.cx - half - gutter, r.cy}};
}

Rect SlideBinder::defaultContentArea() const {
    return Rect{m_slideSize.cx * 5 / 100, m_slideSize.cy * 22 / 100, m_slideSize.cx * 90 / 100, m_slideSize.cy * 70 / 100};
}

Rect SlideBinder::defaultTitleArea() const {
    return Rect{m_slideSize.cx * 5 / 100, m_slideSize.cy * 5 / 100, m_slideSize.cx * 90 / 100, m_slideSize.cy * 15 / 100};
}

void SlideBinder::bindTitle(SlideDraft &draft, const QString &title) const {
    const TextBinder text(m_config.characterBudget(PlaceholderRole::Title), m_config.autoFit);
    if(const Placeholder *ph = draft.layout()->placeholder(PlaceholderRole::Title))
        text.bindText(draft, ShapeTarget::of(ph), title);
    else
        text.bindText(draft, ShapeTarget::at(defaultTitleArea()), title);
}

ShapeTarget SlideBinder::bodyTarget(const SlideDraft &draft) const {
    const Layout &layout = *draft.layout();
    if(const Placeholder *ph = layout.placeholder(PlaceholderRole::Body)) return ShapeTarget::of(ph);
    if(const Placeholder *ph = layout.placeholder(PlaceholderRole::ColumnLeft)) return ShapeTarget::of(ph);
    return ShapeTarget::at(defaultContentArea());
}

void SlideBinder::bindTitleSlide(SlideDraft &draft, const TitleSlide &s) const {
    bindTitle(draft, s.title());
    if(s.subtitle().isEmpty()) return;
    const TextBinder text(m_config.subtitleCharBudget, m_config.autoFit);
    text.bindText(draft, bodyTarget(draft), s.subtitle());
}

void SlideBinder::bindContent(SlideDraft &draft, const ContentSlide &s) const {
    bindTitle(draft, s.title());
    const TextBinder text(m_config.characterBudget(PlaceholderRole::Body), m_config.autoFit);
    text.bindBlock(draft, bodyTarget(draft), s.body());
}

void SlideBinder::bindImageSlide(SlideDraft &draft, const ImageSlide &s, const DecodedImage &image, bool degraded) const {
    bindTitle(draft, s.title());
    const Layout &layout = *draft.layout();
    const TextBinder text(m_config.characterBudget(PlaceholderRole::Body), m_config.autoFit);
    const bool hasText = !s.body().isEmpty();
    const Placeholder *picture = degraded ? nullptr : layout.placeholder(PlaceholderRole::Picture);

    if(picture) {
        bindImage(draft, ShapeTarget::of(picture), image, s.image().query);
        if(!hasText) return;
        if(const Placeholder *body = layout.placeholder(PlaceholderRole::Body)) {
            text.bindBlock(draft, ShapeTarget::of(body), s.body());
            return;
        }
        // Text goes to the half of the content area the picture leaves free.
        const auto halves = splitHorizontally(defaultContentArea());
        const bool pictureOnRight = picture->bounds.x + picture->bounds.cx / 2 > m_slideSize.cx / 2;
        text.bindBlock(draft, ShapeTarget::at(pictureOnRight ? halves.first : halves.second), s.body());
        return;
    }

    // No picture placeholder: share the body region between text and image.
    const ShapeTarget body = bodyTarget(draft);
    const Rect region = body.rect();
    Rect imageRect = region;
    Rect textRect;
    if(hasText) {
        const auto halves = splitHorizontally(region);
        const bool imageLeft = s.kind() == SlideKind::ImageLeft;
        imageRect = imageLeft ? halves.first : halves.second;
        textRect = imageLeft ? halves.second : halves.first;
        text.bindBlock(draft, ShapeTarget{body.placeholder, textRect}, s.body());
    }
    bindImage(draft, ShapeTarget::at(imageRect), image, s.image().query);
}

ShapeTarget SlideBinder::bindBesideText(SlideDraft &draft, PlaceholderRole role, const TextBlock &body, bool degraded) const {
    const Layout &layout = *draft.layout();
    const Placeholder *ph = degraded ? nullptr : layout.placeholder(role);
    const ShapeTarget content = ph ? ShapeTarget::of(ph) : ShapeTarget::at(bodyTarget(draft).rect());
    if(body.isEmpty()) return content;
    const TextBinder text(m_config.characterBudget(PlaceholderRole::Body), m_config.autoFit);
    const Placeholder *bodyPh = layout.placeholder(PlaceholderRole::Body);
    if(ph && bodyPh) {
        text.bindBlock(draft, ShapeTarget::of(bodyPh), body);
        return content;
    }
    // Text on the left, content on the right of one shared region.
    const ShapeTarget shared = ph ? content : bodyTarget(draft);
    const auto halves = splitHorizontally(shared.rect());
    text.bindBlock(draft, ShapeTarget{ph ? nullptr : shared.placeholder, halves.first}, body);
    return ShapeTarget{ph, halves.second};
}

void SlideBinder::bindTableSlide(SlideDraft &draft, const TableSlide &s, bool degraded) const {
    bindTitle(draft, s.title());
    const ShapeTarget target = bindBesideText(draft, PlaceholderRole::Table, s.body(), degraded);
    const TableShape shape = bindTable(draft, target, s.table());
    qCDebug(lcRender, "Table bound as %dx%d", shape.rows, shape.columns);
}

bool SlideBinder::bindChartSlide(SlideDraft &draft, const ChartSlide &s, bool degraded, int slideIndex, Error *error) const {
    bindTitle(draft, s.title());
    const ShapeTarget target = bindBesideText(draft, PlaceholderRole::Chart, s.body(), degraded);
    Error chartError;
    if(!bindChart(draft, target, s.chart(), &chartError)) {
        setError(error, chartError.code, chartError.message, slideIndex);
        return false;
    }
    return true;
}

void SlideBinder::bindTwoColumns(SlideDraft &draft, const TwoColumnSlide &s) const {
    bindTitle(draft, s.title());
    const Layout &layout = *draft.layout();
    const TextBinder text(m_config.characterBudget(PlaceholderRole::ColumnLeft), m_config.autoFit);
    const Placeholder *left = layout.placeholder(PlaceholderRole::ColumnLeft);
    const Placeholder *right = layout.placeholder(PlaceholderRole::ColumnRight);
    if(left && right) {
        text.bindBullets(draft, ShapeTarget::of(left), s.left(), BulletStyle::Character);
        text.bindBullets(draft, ShapeTarget::of(right), s.right(), BulletStyle::Character);
        return;
    }
    const ShapeTarget body = bodyTarget(draft);
    const auto halves = splitHorizontally(body.rect());
    text.bindBullets(draft, ShapeTarget{body.placeholder, halves.first}, s.left(), BulletStyle::Character);
    text.bindBullets(draft, ShapeTarget::at(halves.second), s.right(), BulletStyle::Character);
}

std::optional<SlideDraft> SlideBinder::bind(const Slide &slide, const ResolvedLayout &resolved,
                                            const DecodedImage *image, int slideIndex, Error *error) const {
    SlideDraft draft(resolved.layout, m_language);
    switch(slide.kind()) {
    case SlideKind::Title:
        bindTitleSlide(draft, static_cast<const TitleSlide &>(slide));
        break;
    case SlideKind::ContentOnly:
        bindContent(draft, static_cast<const ContentSlide &>(slide));
        break;
    case SlideKind::ImageRight:
    case SlideKind::ImageLeft:
    case SlideKind::ImageFull:
        if(!image || image->isNull()) {
            setError(error, ErrorCode::DocumentAssembly, QStringLiteral("no image available for slide"), slideIndex);
            return std::nullopt;
        }
        bindImageSlide(draft, static_cast<const ImageSlide &>(slide), *image, resolved.degraded);
        break;
    case SlideKind::Table:
        bindTableSlide(draft, static_cast<const TableSlide &>(slide), resolved.degraded);
        break;
    case SlideKind::Chart:
        if(!bindChartSlide(draft, static_cast<const ChartSlide &>(slide), resolved.degraded, slideIndex, error)) return std::nullopt;
        break;
    case SlideKind::TwoColumns:
        bindTwoColumns(draft, static_cast<const TwoColumnSlide &>(slide));
        break;
    }
    return std::optional<SlideDraft>(std::move(draft));
}

}} // namespace QtPptxTemplate::engine
