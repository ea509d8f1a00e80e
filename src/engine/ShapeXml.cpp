#include "engine/ShapeXml.hpp"
#include "util/Emu.hpp"

namespace QtPptxTemplate { namespace engine {

void appendPlaceholderRef(pugi::xml_node nvPr, const Placeholder &ph) {
    auto e = nvPr.append_child("p:ph");
    if(ph.type != QLatin1String("obj")) e.append_attribute("type") = ph.type.toUtf8().constData();
    if(!ph.idx.isEmpty()) e.append_attribute("idx") = ph.idx.toUtf8().constData();
}

void appendXfrm(pugi::xml_node parent, const char *name, const Rect &r) {
    auto xfrm = parent.append_child(name);
    auto off = xfrm.append_child("a:off");
    off.append_attribute("x") = static_cast<long long>(r.x);
    off.append_attribute("y") = static_cast<long long>(r.y);
    auto ext = xfrm.append_child("a:ext");
    ext.append_attribute("cx") = static_cast<long long>(r.cx);
    ext.append_attribute("cy") = static_cast<long long>(r.cy);
}

pugi::xml_node appendRun(pugi::xml_node paragraph, const QString &text, const QString &lang,
                         const std::optional<TextFormatting> &fmt, const QString &hyperlinkRelId) {
    auto r = paragraph.append_child("a:r");
    auto rPr = r.append_child("a:rPr");
    rPr.append_attribute("lang") = lang.toUtf8().constData();
    if(fmt && fmt->size > 0) rPr.append_attribute("sz") = util::pointsToFontUnits(fmt->size);
    if(fmt && fmt->bold) rPr.append_attribute("b") = 1;
    if(fmt && fmt->italic) rPr.append_attribute("i") = 1;
    if(!hyperlinkRelId.isEmpty()) rPr.append_attribute("u") = "sng";
    rPr.append_attribute("dirty") = 0;

    QString color;
    if(!hyperlinkRelId.isEmpty()) color = QStringLiteral("0000FF");
    else if(fmt && !fmt->color.isEmpty()) color = fmt->color.mid(1).toUpper();
    if(!color.isEmpty()) rPr.append_child("a:solidFill").append_child("a:srgbClr").append_attribute("val") = color.toUtf8().constData();
    if(!hyperlinkRelId.isEmpty()) rPr.append_child("a:hlinkClick").append_attribute("r:id") = hyperlinkRelId.toUtf8().constData();

    auto t = r.append_child("a:t");
    t.text().set(text.toUtf8().constData());
    return r;
}

pugi::xml_node appendCNvPr(pugi::xml_node nv, unsigned id, const QString &name, const QString &descr) {
    auto c = nv.append_child("p:cNvPr");
    c.append_attribute("id") = id;
    c.append_attribute("name") = name.toUtf8().constData();
    if(!descr.isEmpty()) c.append_attribute("descr") = descr.toUtf8().constData();
    return c;
}

}} // namespace QtPptxTemplate::engine
