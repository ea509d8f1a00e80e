/** \file XmlPart.hpp
 *  Thin pugixml wrapper for one OOXML part.
 */
#pragma once
#include <QByteArray>
#include <QString>
#include <pugixml.hpp>
#include <vector>

namespace QtPptxTemplate { namespace xml {

class XmlPart {
public:
    /** Parse bytes. Returns false on malformed XML. */
    bool load(const QByteArray &data);
    /** Serialize with an XML declaration, no indentation. */
    QByteArray save() const;

    pugi::xml_document & doc() { return m_doc; }
    const pugi::xml_document & doc() const { return m_doc; }
    pugi::xml_node root() const { return m_doc.document_element(); }

    /** XPath query over qualified names (prefixes are matched literally, e.g. "//p:sp"). */
    std::vector<pugi::xml_node> selectAll(const char *xpath) const;
    pugi::xml_node selectOne(const char *xpath) const;

private:
    pugi::xml_document m_doc;
};

/** Relationship helpers shared by catalog and assembler. */
QString relsPartName(const QString &partName);
/** Resolve a relative relationship target against the part that owns the relationship. */
QString resolveTarget(const QString &sourcePart, const QString &target);
/** Relative target from one part to another (both package-absolute, no leading slash). */
QString relativeTarget(const QString &fromPart, const QString &toPart);

}} // namespace QtPptxTemplate::xml
