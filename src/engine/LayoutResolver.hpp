/** \file LayoutResolver.hpp
 *  Maps a slide kind to a template layout, falling back to ContentOnly.
 */
#pragma once
#include "QtPptxTemplate/TemplateCatalog.hpp"

namespace QtPptxTemplate { namespace engine {

struct ResolvedLayout {
    LayoutHandle layout;
    bool degraded{false}; // ContentOnly stands in for the requested kind
};

class LayoutResolver {
public:
    explicit LayoutResolver(std::shared_ptr<const TemplateCatalog> catalog) : m_catalog(std::move(catalog)) {}
    /** Never fails for a catalog that loaded successfully. */
    ResolvedLayout resolve(SlideKind kind, int slideIndex = -1) const;
private:
    std::shared_ptr<const TemplateCatalog> m_catalog;
};

}} // namespace QtPptxTemplate::engine
