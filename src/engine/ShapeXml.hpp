/** \file ShapeXml.hpp
 *  DrawingML/PresentationML building blocks shared by the binders.
 */
#pragma once
#include "QtPptxTemplate/Layout.hpp"
#include "QtPptxTemplate/Slide.hpp"
#include <pugixml.hpp>
#include <QString>
#include <optional>

namespace QtPptxTemplate { namespace engine {

class SlideDraft;

/** Where a binder puts its shape: a layout placeholder, explicit bounds, or both
 *  (placeholder reference with overridden geometry). */
struct ShapeTarget {
    const Placeholder *placeholder{nullptr};
    std::optional<Rect> bounds;

    static ShapeTarget of(const Placeholder *ph) { return ShapeTarget{ph, std::nullopt}; }
    static ShapeTarget at(const Rect &r) { return ShapeTarget{nullptr, r}; }
    /** Effective rectangle: explicit bounds, else the placeholder's. */
    Rect rect() const { return bounds ? *bounds : (placeholder ? placeholder->bounds : Rect{}); }
};

/** <p:ph> with the placeholder's type (omitted for "obj") and idx. */
void appendPlaceholderRef(pugi::xml_node nvPr, const Placeholder &ph);
/** <name><a:off/><a:ext/></name> */
void appendXfrm(pugi::xml_node parent, const char *name, const Rect &r);
/** <a:r> with language, formatting and optional hyperlink relationship. */
pugi::xml_node appendRun(pugi::xml_node paragraph, const QString &text, const QString &lang,
                         const std::optional<TextFormatting> &fmt = std::nullopt,
                         const QString &hyperlinkRelId = QString());
/** Standard non-visual block (<p:cNvPr id name descr/>). */
pugi::xml_node appendCNvPr(pugi::xml_node nv, unsigned id, const QString &name, const QString &descr = QString());

}} // namespace QtPptxTemplate::engine
