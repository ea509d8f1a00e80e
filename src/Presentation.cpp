#include "QtPptxTemplate/Presentation.hpp"
#include "engine/DocumentAssembler.hpp"
#include "engine/ImageResolver.hpp"
#include "engine/LayoutResolver.hpp"
#include "engine/SlideBinder.hpp"
#include "opc/Package.hpp"
#include "util/Logging.hpp"

namespace QtPptxTemplate {

Presentation::Presentation(std::shared_ptr<const TemplateCatalog> catalog, RenderConfig config)
    : m_catalog(std::move(catalog)), m_config(std::move(config)), m_fallback(loadFallbackImage(m_config.fallbackImagePath)) {}

Presentation::~Presentation() = default;

std::optional<RenderedDeck> Presentation::render(const SlideDeck &deck, const QString &filenameHint) {
    clearError();
    if(!m_catalog) {
        fail(Error{ErrorCode::TemplateCatalog, QStringLiteral("no template catalog"), -1});
        return std::nullopt;
    }

    RenderedDeck out;
    out.slideCount = deck.slideCount();
    out.structure = deck.toJson();
    out.filename = sanitizeFilename(filenameHint.isEmpty() ? deck.properties().title : filenameHint);

    const engine::ImageResolver images(m_provider, m_config, m_fallback, m_cancel);
    const auto resolvedImages = images.resolveAll(deck);

    const engine::LayoutResolver layouts(m_catalog);
    const engine::SlideBinder binder(m_config, m_catalog->slideSize(), deck.language());
    std::vector<engine::SlideDraft> drafts;
    drafts.reserve(static_cast<size_t>(deck.slideCount()));
    for(int i = 0; i < deck.slideCount(); ++i) {
        const Slide &slide = deck.slide(i);
        const engine::ResolvedLayout layout = layouts.resolve(slide.kind(), i);
        if(!layout.layout) {
            fail(Error{ErrorCode::TemplateCatalog, QStringLiteral("template has no layout for slide"), i});
            return std::nullopt;
        }
        if(layout.degraded) out.degradedSlides.push_back(DegradedSlide{i, slide.kind()});

        const DecodedImage *image = nullptr;
        const auto &resolved = resolvedImages[static_cast<size_t>(i)];
        if(resolved) {
            image = &resolved->image;
            out.images.push_back(SlideImageInfo{i, static_cast<const ImageSlide &>(slide).image().query, resolved->source});
        }

        Error err;
        auto draft = binder.bind(slide, layout, image, i, &err);
        if(!draft) {
            fail(err);
            return std::nullopt;
        }
        drafts.push_back(std::move(*draft));
    }

    // Everything below writes to this request's private copy only.
    std::unique_ptr<opc::Package> package = m_catalog->checkout();
    engine::DocumentAssembler assembler(*package);
    Error err;
    if(!assembler.removeTemplateSlides(&err) || !assembler.addSlides(drafts, &err)
       || !assembler.writeProperties(deck.properties(), deck.slideCount(), &err)) {
        fail(err);
        return std::nullopt;
    }
    auto bytes = assembler.serialize(&err);
    if(!bytes) {
        fail(err);
        return std::nullopt;
    }
    out.package = *bytes;
    qCInfo(lcRender, "Rendered '%s': %d slides, %d degraded", qPrintable(out.filename), out.slideCount,
           static_cast<int>(out.degradedSlides.size()));
    return out;
}

std::optional<RenderedDeck> Presentation::renderJson(const QByteArray &json, const QString &filenameHint, const QString &languageTag) {
    clearError();
    Error err;
    auto deck = SlideDeck::fromJson(json, &err, m_config.defaultChartType);
    if(!deck) {
        fail(err);
        return std::nullopt;
    }
    if(!languageTag.isEmpty() && languageTag != deck->language()) {
        DeckProperties props = deck->properties();
        props.language = languageTag;
        deck = SlideDeck::create(props, deck->slides(), -1, &err);
        if(!deck) {
            fail(err);
            return std::nullopt;
        }
    }
    return render(*deck, filenameHint);
}

} // namespace QtPptxTemplate
