// Title + Table deck renders a header row and data rows with matching columns
#include "QtPptxTemplate/Builder.hpp"
#include "QtPptxTemplate/Presentation.hpp"
#include "MinimalPptx.hpp"
#include <QJsonDocument>
#include <pugixml.hpp>
#include <cassert>
#include <iostream>

using namespace QtPptxTemplate; using namespace testpptx;

static pugi::xml_node firstTable(pugi::xml_document &doc, const QString &xml){
    bool ok = doc.load_string(xml.toUtf8().constData());
    assert(ok);
    return doc.select_node("//a:tbl").node();
}

static int count(pugi::xml_node n, const char *name){ int c = 0; for(auto ch : n.children(name)){ (void)ch; ++c; } return c; }

static QStringList rowTexts(pugi::xml_node tr){
    QStringList out;
    for(auto tc : tr.children("a:tc")){
        QString text;
        for(auto t : tc.select_nodes(".//a:t")) text += QString::fromUtf8(t.node().child_value());
        out << text;
    }
    return out;
}

int main(){
    // Round trip: headers A,B,C and one row 1,2,3 -> 2 rows x 3 columns
    {
        const QByteArray json = R"({"title": "Tables", "slides": [
            {"title": "Welcome", "kind": "title_slide", "subtitle": "Numbers inside"},
            {"title": "Grid", "table": {"headers": ["A", "B", "C"], "rows": [["1", "2", "3"]]}}]})";
        auto catalog = TemplateCatalog::fromData(minimalPptx());
        Presentation pres(catalog);
        auto out = pres.renderJson(json);
        assert(out);
        assert(out->degradedSlides.empty());
        pugi::xml_document doc;
        auto tbl = firstTable(doc, slideXml(out->package, 2));
        assert(tbl);
        assert(count(tbl.child("a:tblGrid"), "a:gridCol") == 3);
        assert(count(tbl, "a:tr") == 2);
        auto tr = tbl.child("a:tr");
        assert(rowTexts(tr) == QStringList({"A","B","C"}));
        assert(rowTexts(tr.next_sibling("a:tr")) == QStringList({"1","2","3"}));
        assert(tbl.child("a:tblPr").attribute("firstRow").as_int() == 1);
        // Header cells are bold
        assert(tr.select_node(".//a:rPr[@b='1']"));
        // The frame is bound to the template's table placeholder
        assert(tbl.parent().parent().parent().child("p:nvGraphicFramePr").child("p:nvPr").child("p:ph").attribute("idx").as_int() == 1);
    }
    // Colored header style
    {
        auto catalog = TemplateCatalog::fromData(minimalPptx());
        auto deck = SlideDeck::create(DeckProperties{"T", {}, {}, {}, "en"}, { makeTableSlide("Styled", {"H1","H2"}, {{"a","b"}}, "header_colored") }, 1);
        assert(deck);
        Presentation pres(catalog);
        auto out = pres.render(*deck);
        assert(out);
        const QString xml = slideXml(out->package, 1);
        assert(xml.contains("<a:srgbClr val=\"003366\"/>"));
        assert(xml.contains("<a:srgbClr val=\"FFFFFF\"/>"));
    }
    // A template grid never decides the table shape
    {
        auto catalog = TemplateCatalog::fromData(minimalPptx({contentLayout(), {"Table", "tbl", titlePh() + tableGridPh(3, 1, 4, 3)}}));
        assert(catalog);
        Presentation pres(catalog);
        auto small = SlideDeck::create(DeckProperties{"T", {}, {}, {}, "en"}, { makeTableSlide("Small", {"A","B","C"}, {{"1","2","3"}}) }, 1);
        assert(small);
        auto out = pres.render(*small);
        assert(out);
        pugi::xml_document doc;
        auto tbl = firstTable(doc, slideXml(out->package, 1));
        assert(count(tbl, "a:tr") == 2);
        assert(count(tbl.child("a:tblGrid"), "a:gridCol") == 3);
        assert(rowTexts(tbl.child("a:tr")) == QStringList({"A","B","C"}));
        assert(rowTexts(tbl.child("a:tr").next_sibling("a:tr")) == QStringList({"1","2","3"}));

        std::vector<QStringList> rows;
        for(int i = 0; i < 5; ++i) rows.push_back({QString::number(i), "x", "y"});
        auto big = SlideDeck::create(DeckProperties{"T", {}, {}, {}, "en"}, { makeTableSlide("Big", {"A","B","C"}, rows) }, 1);
        assert(big);
        out = pres.render(*big);
        assert(out);
        pugi::xml_document doc2;
        tbl = firstTable(doc2, slideXml(out->package, 1));
        assert(count(tbl, "a:tr") == 6);
        assert(rowTexts(tbl.child("a:tr").next_sibling("a:tr")) == QStringList({"0","x","y"}));

        auto narrow = SlideDeck::create(DeckProperties{"T", {}, {}, {}, "en"}, { makeTableSlide("Narrow", {"A","B"}, {{"1","2"}}) }, 1);
        assert(narrow);
        out = pres.render(*narrow);
        assert(out);
        pugi::xml_document doc3;
        tbl = firstTable(doc3, slideXml(out->package, 1));
        assert(count(tbl.child("a:tblGrid"), "a:gridCol") == 2);
        assert(rowTexts(tbl.child("a:tr")) == QStringList({"A","B"}));
    }
    // Text given with a table sits beside it and survives the JSON echo
    {
        const QByteArray json = R"({"title": "Tables", "slides": [
            {"title": "Grid", "content": "Quarterly totals", "bullet_points": ["Up in Q3"],
             "table": {"headers": ["A", "B"], "rows": [["1", "2"]]}}]})";
        auto deck = SlideDeck::fromJson(json);
        assert(deck);
        const auto &slide = static_cast<const TableSlide &>(*deck->slides().front());
        assert(slide.body().runs.size() == 1 && slide.body().bullets.size() == 1);
        const QString echoed = QString::fromUtf8(QJsonDocument(deck->toJson()).toJson());
        assert(echoed.contains("Quarterly totals") && echoed.contains("Up in Q3"));

        auto catalog = TemplateCatalog::fromData(minimalPptx());
        Presentation pres(catalog);
        auto out = pres.render(*deck);
        assert(out);
        const QString xml = slideXml(out->package, 1);
        assert(xml.contains("<a:t>Quarterly totals</a:t>"));
        assert(xml.contains("<a:t>Up in Q3</a:t>"));
        assert(xml.contains("txBox=\"1\""));
        pugi::xml_document doc;
        auto tbl = firstTable(doc, xml);
        assert(rowTexts(tbl.child("a:tr")) == QStringList({"A","B"}));
        // The table keeps its placeholder but only takes the right half
        auto frame = tbl.parent().parent().parent();
        assert(frame.child("p:nvGraphicFramePr").child("p:nvPr").child("p:ph"));
        assert(frame.child("p:xfrm").child("a:ext").attribute("cx").as_llong() < 10515600 / 2 + 1);
    }
    std::cout << "table_round_trip_test passed" << std::endl; return 0;
}
