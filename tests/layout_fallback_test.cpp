// Slides whose kind has no layout are rendered with Content Only and reported as degraded
#include "QtPptxTemplate/Builder.hpp"
#include "QtPptxTemplate/Presentation.hpp"
#include "engine/LayoutResolver.hpp"
#include "MinimalPptx.hpp"
#include <QJsonArray>
#include <cassert>
#include <iostream>

using namespace QtPptxTemplate; using namespace testpptx;

int main(){
    auto catalog = TemplateCatalog::fromData(minimalPptx({titleLayout(), contentLayout()}));
    assert(catalog);

    // Resolver level
    {
        engine::LayoutResolver resolver(catalog);
        auto r = resolver.resolve(SlideKind::Chart, 3);
        assert(r.degraded);
        assert(r.layout->kind() == SlideKind::ContentOnly);
        auto t = resolver.resolve(SlideKind::Title);
        assert(!t.degraded && t.layout->kind() == SlideKind::Title);
    }

    // Full render: every non-text kind is degraded but its content is kept
    {
        auto deck = SlideDeck::create(DeckProperties{"Fallbacks", {}, {}, {}, "en"}, {
            makeTitleSlide("Welcome", "to the deck"),
            makeTableSlide("Table", {"A","B"}, {{"1","2"}}),
            makeChartSlide("Chart", ChartType::Pie, {"x","y"}, { {"share", {40, 60}} }),
            makeImageSlide(SlideKind::ImageRight, "Image", "harbour at dawn", "Caption text"),
            makeTwoColumnSlide("Columns", {"left item"}, {"right item"}) }, 5);
        assert(deck);
        Presentation pres(catalog);
        auto out = pres.render(*deck);
        assert(out);
        assert(!pres.lastError());
        assert(out->slideCount == 5);
        assert(out->degradedSlides.size() == 4);
        assert(!out->isDegraded(0));
        for(int i = 1; i <= 4; ++i) assert(out->isDegraded(i));
        assert(out->degradedSlides[1].requestedKind == SlideKind::Chart);

        const QString table = slideXml(out->package, 2);
        assert(table.contains("<a:tbl>"));
        assert(table.contains(">Table<"));
        const QString tableRels = readPart(out->package, "ppt/slides/_rels/slide2.xml.rels");
        assert(tableRels.contains("../slideLayouts/slideLayout2.xml"));

        const QString chart = slideXml(out->package, 3);
        assert(chart.contains("<c:chart"));
        assert(readPart(out->package, "ppt/charts/chart1.xml").contains("<c:pieChart>"));

        const QString image = slideXml(out->package, 4);
        assert(image.contains("<p:pic>"));
        assert(image.contains("Caption text"));
        assert(out->images.size() == 1);
        assert(out->images[0].slideIndex == 3);
        assert(out->images[0].source == ImageSource::Fallback);

        const QString cols = slideXml(out->package, 5);
        assert(cols.contains("left item") && cols.contains("right item"));

        const QJsonObject meta = out->metadata();
        assert(meta.value("degraded_slides").toArray().size() == 4);
        assert(meta.value("degraded_slides").toArray().at(0).toObject().value("requested_kind").toString() == "table");
    }
    std::cout << "layout_fallback_test passed" << std::endl; return 0;
}
