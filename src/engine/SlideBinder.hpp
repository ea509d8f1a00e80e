/** \file SlideBinder.hpp
 *  Turns one Slide plus its resolved layout into a SlideDraft, dispatching on the slide kind.
 *  When the layout is a ContentOnly stand-in, non-text content is laid out inside the body
 *  region instead of dedicated placeholders.
 */
#pragma once
#include "QtPptxTemplate/Error.hpp"
#include "QtPptxTemplate/RenderConfig.hpp"
#include "engine/LayoutResolver.hpp"
#include "engine/SlideDraft.hpp"
#include <optional>
#include <utility>

namespace QtPptxTemplate { namespace engine {

class SlideBinder {
public:
    SlideBinder(const RenderConfig &config, const Rect &slideSize, QString language)
        : m_config(config), m_slideSize(slideSize), m_language(std::move(language)) {}

    /** image must be non-null for image kinds. std::nullopt with ChartDataMismatch on bad charts. */
    std::optional<SlideDraft> bind(const Slide &slide, const ResolvedLayout &resolved,
                                   const DecodedImage *image, int slideIndex, Error *error = nullptr) const;

    /** Area used for content when a layout has no body placeholder. */
    Rect defaultContentArea() const;
    Rect defaultTitleArea() const;

private:
    void bindTitle(SlideDraft &draft, const QString &title) const;
    ShapeTarget bodyTarget(const SlideDraft &draft) const;
    void bindTitleSlide(SlideDraft &draft, const TitleSlide &s) const;
    void bindContent(SlideDraft &draft, const ContentSlide &s) const;
    void bindImageSlide(SlideDraft &draft, const ImageSlide &s, const DecodedImage &image, bool degraded) const;
    /** Binds body text next to table or chart content and returns where the content goes. */
    ShapeTarget bindBesideText(SlideDraft &draft, PlaceholderRole role, const TextBlock &body, bool degraded) const;
    void bindTableSlide(SlideDraft &draft, const TableSlide &s, bool degraded) const;
    bool bindChartSlide(SlideDraft &draft, const ChartSlide &s, bool degraded, int slideIndex, Error *error) const;
    void bindTwoColumns(SlideDraft &draft, const TwoColumnSlide &s) const;

    const RenderConfig &m_config;
    Rect m_slideSize;
    QString m_language;
};

/** Left and right parts of r separated by a small gutter. */
std::pair<Rect, Rect> splitHorizontally(const Rect &r);

}} // namespace QtPptxTemplate::engine
