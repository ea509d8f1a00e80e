#include "engine/SlideDraft.hpp"
#include <sstream>

namespace QtPptxTemplate { namespace engine {

SlideDraft::SlideDraft(LayoutHandle layout, QString language)
    : m_layout(std::move(layout)), m_language(std::move(language)), m_doc(std::make_unique<pugi::xml_document>()) {
    auto decl = m_doc->append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";
    decl.append_attribute("standalone") = "yes";
    auto sld = m_doc->append_child("p:sld");
    sld.append_attribute("xmlns:a") = ns::a;
    sld.append_attribute("xmlns:r") = ns::r;
    sld.append_attribute("xmlns:p") = ns::p;
    m_spTree = sld.append_child("p:cSld").append_child("p:spTree");
    auto nvGrp = m_spTree.append_child("p:nvGrpSpPr");
    auto cNvPr = nvGrp.append_child("p:cNvPr");
    cNvPr.append_attribute("id") = 1;
    cNvPr.append_attribute("name") = "";
    nvGrp.append_child("p:cNvGrpSpPr");
    nvGrp.append_child("p:nvPr");
    auto xfrm = m_spTree.append_child("p:grpSpPr").append_child("a:xfrm");
    auto point = [&xfrm](const char *name){ auto e = xfrm.append_child(name); e.append_attribute("x") = 0; e.append_attribute("y") = 0; };
    auto extent = [&xfrm](const char *name){ auto e = xfrm.append_child(name); e.append_attribute("cx") = 0; e.append_attribute("cy") = 0; };
    point("a:off"); extent("a:ext"); point("a:chOff"); extent("a:chExt");
    sld.append_child("p:clrMapOvr").append_child("a:masterClrMapping");

    m_rels.push_back(DraftRelationship{DraftRelationship::Kind::Layout, QStringLiteral("rId1"), m_layout->partName(), -1});
}

QString SlideDraft::addHyperlink(const QString &url) {
    for(const auto &r : m_rels) if(r.kind == DraftRelationship::Kind::Hyperlink && r.target == url) return r.id;
    const QString id = nextRelId();
    m_rels.push_back(DraftRelationship{DraftRelationship::Kind::Hyperlink, id, url, -1});
    return id;
}

QString SlideDraft::addImage(const DecodedImage &image) {
    const QString id = nextRelId();
    m_rels.push_back(DraftRelationship{DraftRelationship::Kind::Image, id, QString(), static_cast<int>(m_images.size())});
    m_images.push_back(image);
    return id;
}

QString SlideDraft::addChart(const QByteArray &chartXml) {
    const QString id = nextRelId();
    m_rels.push_back(DraftRelationship{DraftRelationship::Kind::Chart, id, QString(), static_cast<int>(m_charts.size())});
    m_charts.push_back(chartXml);
    return id;
}

QByteArray SlideDraft::xml() const {
    std::ostringstream ss;
    m_doc->save(ss, "", pugi::format_raw, pugi::encoding_utf8);
    const std::string s = ss.str();
    return QByteArray(s.data(), static_cast<qsizetype>(s.size()));
}

}} // namespace QtPptxTemplate::engine
