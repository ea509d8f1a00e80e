/** \file DocumentAssembler.hpp
 *  Writes bound slides into a working copy of the template package: replaces the template's
 *  own slides, registers parts, relationships and content types, updates document properties.
 */
#pragma once
#include "QtPptxTemplate/Error.hpp"
#include "QtPptxTemplate/SlideDeck.hpp"
#include "engine/SlideDraft.hpp"
#include <QByteArray>
#include <optional>
#include <vector>

namespace QtPptxTemplate {
namespace opc { class Package; }
}

namespace QtPptxTemplate { namespace engine {

class DocumentAssembler {
public:
    explicit DocumentAssembler(opc::Package &package) : m_package(package) {}

    /** Remove every slide the template ships with (and their notes). */
    bool removeTemplateSlides(Error *error = nullptr);
    /** Append slides in order. */
    bool addSlides(const std::vector<SlideDraft> &drafts, Error *error = nullptr);
    /** dc:title, dc:creator, dc:subject, dc:language and the app.xml slide count. */
    bool writeProperties(const DeckProperties &properties, int slideCount, Error *error = nullptr);
    /** Zip the package. std::nullopt with DocumentAssembly on failure. */
    std::optional<QByteArray> serialize(Error *error = nullptr) const;

private:
    QString freePartName(const QString &pattern) const;
    opc::Package &m_package;
};

}} // namespace QtPptxTemplate::engine
