#include "xml/XmlPart.hpp"
#include <QStringList>
#include <sstream>

namespace QtPptxTemplate { namespace xml {

bool XmlPart::load(const QByteArray &data) {
    auto res = m_doc.load_buffer(data.constData(), static_cast<size_t>(data.size()),
                                 pugi::parse_default | pugi::parse_declaration | pugi::parse_ws_pcdata_single);
    return res && m_doc.document_element();
}

QByteArray XmlPart::save() const {
    std::ostringstream ss;
    unsigned flags = pugi::format_raw;
    if(!m_doc.first_child() || m_doc.first_child().type() != pugi::node_declaration) flags |= pugi::format_no_declaration;
    if(flags & pugi::format_no_declaration) ss << "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";
    m_doc.save(ss, "", flags, pugi::encoding_utf8);
    const std::string s = ss.str();
    return QByteArray(s.data(), static_cast<qsizetype>(s.size()));
}

std::vector<pugi::xml_node> XmlPart::selectAll(const char *xpath) const {
    std::vector<pugi::xml_node> out;
    pugi::xpath_query q(xpath);
    for(const auto &n : q.evaluate_node_set(m_doc)) out.push_back(n.node());
    return out;
}

pugi::xml_node XmlPart::selectOne(const char *xpath) const {
    return m_doc.select_node(xpath).node();
}

QString relsPartName(const QString &partName) {
    const auto slash = partName.lastIndexOf('/');
    return partName.left(slash + 1) + QStringLiteral("_rels/") + partName.mid(slash + 1) + QStringLiteral(".rels");
}

QString resolveTarget(const QString &sourcePart, const QString &target) {
    if(target.startsWith('/')) return target.mid(1);
    QStringList segs = sourcePart.split('/');
    segs.removeLast();
    for(const auto &s : target.split('/')) {
        if(s == QLatin1String("..")) { if(!segs.isEmpty()) segs.removeLast(); }
        else if(s != QLatin1String(".") && !s.isEmpty()) segs << s;
    }
    return segs.join('/');
}

QString relativeTarget(const QString &fromPart, const QString &toPart) {
    QStringList from = fromPart.split('/'); from.removeLast();
    QStringList to = toPart.split('/');
    int common = 0;
    while(common < from.size() && common < to.size() - 1 && from[common] == to[common]) ++common;
    QStringList out;
    for(int i = common; i < from.size(); ++i) out << QStringLiteral("..");
    for(int i = common; i < to.size(); ++i) out << to[i];
    return out.join('/');
}

}} // namespace QtPptxTemplate::xml
