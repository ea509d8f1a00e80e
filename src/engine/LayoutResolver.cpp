#include "engine/LayoutResolver.hpp"
#include "util/Logging.hpp"

namespace QtPptxTemplate { namespace engine {

ResolvedLayout LayoutResolver::resolve(SlideKind kind, int slideIndex) const {
    if(auto layout = m_catalog->resolve(kind)) return ResolvedLayout{layout, false};
    qCWarning(lcRender, "Slide %d: no '%s' layout, using '%s'", slideIndex,
              qPrintable(slideKindName(kind)), qPrintable(slideKindName(SlideKind::ContentOnly)));
    return ResolvedLayout{m_catalog->resolve(SlideKind::ContentOnly), true};
}

}} // namespace QtPptxTemplate::engine
