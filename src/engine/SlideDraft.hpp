/** \file SlideDraft.hpp
 *  A slide under construction: its XML plus the relationships, media and chart parts the
 *  binders attached to it. Relationship targets for media and charts are assigned by the
 *  DocumentAssembler when the draft is written into the package.
 */
#pragma once
#include "QtPptxTemplate/ImageProvider.hpp"
#include "QtPptxTemplate/Layout.hpp"
#include <QByteArray>
#include <QString>
#include <memory>
#include <pugixml.hpp>
#include <vector>

namespace QtPptxTemplate { namespace engine {

namespace ns {
constexpr const char *a = "http://schemas.openxmlformats.org/drawingml/2006/main";
constexpr const char *r = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
constexpr const char *p = "http://schemas.openxmlformats.org/presentationml/2006/main";
constexpr const char *c = "http://schemas.openxmlformats.org/drawingml/2006/chart";
constexpr const char *rel = "http://schemas.openxmlformats.org/package/2006/relationships";
} // namespace ns

namespace reltype {
constexpr const char *slideLayout = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/slideLayout";
constexpr const char *image = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/image";
constexpr const char *chart = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/chart";
constexpr const char *hyperlink = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/hyperlink";
constexpr const char *slide = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/slide";
constexpr const char *notesSlide = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/notesSlide";
} // namespace reltype

struct DraftRelationship {
    enum class Kind { Layout, Hyperlink, Image, Chart };
    Kind kind;
    QString id;
    QString target;        // layout part or hyperlink URL; empty for media/charts until assembled
    int payloadIndex{-1};  // index into images()/charts()
};

class SlideDraft {
public:
    SlideDraft(LayoutHandle layout, QString language);
    SlideDraft(SlideDraft &&) = default;
    SlideDraft & operator=(SlideDraft &&) = default;

    const LayoutHandle & layout() const { return m_layout; }
    const QString & language() const { return m_language; }

    pugi::xml_document & doc() { return *m_doc; }
    /** <p:spTree> shapes are appended to. */
    pugi::xml_node spTree() const { return m_spTree; }
    /** Unique shape id within the slide (1 is the group). */
    unsigned nextShapeId() { return m_nextShapeId++; }

    QString addHyperlink(const QString &url);
    QString addImage(const DecodedImage &image);
    QString addChart(const QByteArray &chartXml);

    const std::vector<DraftRelationship> & relationships() const { return m_rels; }
    const std::vector<DecodedImage> & images() const { return m_images; }
    const std::vector<QByteArray> & charts() const { return m_charts; }

    QByteArray xml() const;

private:
    QString nextRelId() const { return QStringLiteral("rId%1").arg(m_rels.size() + 1); }
    LayoutHandle m_layout;
    QString m_language;
    std::unique_ptr<pugi::xml_document> m_doc;
    pugi::xml_node m_spTree;
    unsigned m_nextShapeId{2};
    std::vector<DraftRelationship> m_rels;
    std::vector<DecodedImage> m_images;
    std::vector<QByteArray> m_charts;
};

}} // namespace QtPptxTemplate::engine
