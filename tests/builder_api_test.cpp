// Tests for free builder helper API
#include "QtPptxTemplate/Builder.hpp"
#include "QtPptxTemplate/Presentation.hpp"
#include "MinimalPptx.hpp"
#include <cassert>
#include <iostream>

using namespace QtPptxTemplate; using namespace testpptx;

static std::optional<RenderedDeck> renderOne(SlidePtr slide){
    auto catalog = TemplateCatalog::fromData(minimalPptx()); assert(catalog);
    auto deck = SlideDeck::create(DeckProperties{"Builder", {}, {}, {}, "en-GB"}, {std::move(slide)}, 1); assert(deck);
    Presentation pres(catalog); return pres.render(*deck);
}

int main(){
    // Text builder with bullets: numbered, level-aware, language tagged
    {
        auto slide = makeContentSlide("Agenda", "Intro paragraph", {"First","Second"});
        auto out = renderOne(slide); assert(out);
        QString xml = slideXml(out->package, 1);
        assert(xml.contains("Intro paragraph")); assert(xml.contains("First")); assert(xml.contains("Second"));
        assert(xml.count("<a:buAutoNum type=\"arabicPeriod\"/>") == 2);
        assert(xml.contains("lang=\"en-GB\""));
        assert(!xml.contains("lang=\"en\""));
    }
    // Two column builder uses both column placeholders with character bullets
    {
        auto out = renderOne(makeTwoColumnSlide("Compare", {"Left A","Left B"}, {"Right A"})); assert(out);
        QString xml = slideXml(out->package, 1);
        assert(xml.contains("Left B")); assert(xml.contains("Right A"));
        assert(xml.contains("<p:ph idx=\"1\"/>")); assert(xml.contains("<p:ph idx=\"2\"/>"));
        assert(xml.count("<a:buChar") == 3);
        assert(out->degradedSlides.empty());
    }
    // Formatted runs and hyperlinks
    {
        TextBlock body;
        body.runs.push_back(TextRun{"Bold red ", TextFormatting{true, false, "#ff0000", 18}, QString()});
        body.runs.push_back(TextRun{"docs", std::nullopt, "https://example.org/docs"});
        auto out = renderOne(std::make_shared<ContentSlide>("Links", body)); assert(out);
        QString xml = slideXml(out->package, 1);
        assert(xml.contains("sz=\"1800\"")); assert(xml.contains("b=\"1\""));
        assert(xml.contains("<a:srgbClr val=\"FF0000\"/>"));
        assert(xml.contains("<a:hlinkClick r:id=\"rId2\"/>"));
        QString rels = readPart(out->package, "ppt/slides/_rels/slide1.xml.rels");
        assert(rels.contains("Target=\"https://example.org/docs\"")); assert(rels.contains("TargetMode=\"External\""));
    }
    // Title builder places the subtitle in the subtitle placeholder
    {
        auto out = renderOne(makeTitleSlide("Hello", "World")); assert(out);
        QString xml = slideXml(out->package, 1);
        assert(xml.contains("<p:ph type=\"ctrTitle\"/>")); assert(xml.contains("<p:ph type=\"subTitle\" idx=\"1\"/>"));
        assert(xml.contains(">World<"));
    }
    std::cout << "builder_api_test passed" << std::endl; return 0;
}
