/** \file ImageResolver.hpp
 *  Resolves every image slide of a deck on a bounded worker pool. Results come back indexed
 *  by slide so completion order never affects slide order. A fetch that fails, times out,
 *  returns non-image bytes or is cancelled yields the fallback image.
 */
#pragma once
#include "QtPptxTemplate/ImageProvider.hpp"
#include "QtPptxTemplate/RenderConfig.hpp"
#include "QtPptxTemplate/RenderedDeck.hpp"
#include "QtPptxTemplate/SlideDeck.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace QtPptxTemplate { namespace engine {

struct ResolvedImage {
    DecodedImage image;
    ImageSource source{ImageSource::Fallback};
};

class ImageResolver {
public:
    ImageResolver(std::shared_ptr<ImageProvider> provider, const RenderConfig &config,
                  DecodedImage fallback, CancellationToken cancel);

    /** One entry per slide; std::nullopt for slides without an image. */
    std::vector<std::optional<ResolvedImage>> resolveAll(const SlideDeck &deck) const;
    /** Synchronous resolution of one descriptor (runs on the calling thread). */
    ResolvedImage resolve(const ImageDescriptor &descriptor) const;

private:
    ResolvedImage fallbackFor(const ImageDescriptor &descriptor) const;

    std::shared_ptr<ImageProvider> m_provider;
    std::chrono::milliseconds m_timeout;
    int m_workers;
    DecodedImage m_fallback;
    CancellationToken m_cancel;
};

}} // namespace QtPptxTemplate::engine
