// Deck construction and JSON input validation
#include "QtPptxTemplate/Builder.hpp"
#include "QtPptxTemplate/SlideDeck.hpp"
#include <QJsonArray>
#include <QJsonObject>
#include <cassert>
#include <iostream>

using namespace QtPptxTemplate;

static DeckProperties props(){ DeckProperties p; p.title = "Quarterly Review"; return p; }

int main(){
    // Ragged table rows are rejected before any rendering
    {
        Error err;
        auto deck = SlideDeck::create(props(), { makeTableSlide("Numbers", {"A","B","C"}, {{"1","2","3"}, {"4","5"}}) }, 1, &err);
        assert(!deck);
        assert(err.code == ErrorCode::SchemaValidation);
        assert(err.slideIndex == 0);
        assert(err.message.contains("row 1"));
    }
    // Chart series length must equal the category count
    {
        Error err;
        auto deck = SlideDeck::create(props(), {
            makeContentSlide("Intro", "Hello"),
            makeChartSlide("Revenue", ChartType::Bar, {"Q1","Q2","Q3"}, { {"2024", {1.0, 2.0}} }) }, 2, &err);
        assert(!deck);
        assert(err.code == ErrorCode::SchemaValidation);
        assert(err.slideIndex == 1);
    }
    // Declared count mismatch and empty decks
    {
        Error err;
        assert(!SlideDeck::create(props(), { makeContentSlide("Intro", "Hello") }, 2, &err));
        assert(err.code == ErrorCode::SchemaValidation);
        assert(!SlideDeck::create(props(), {}, -1, &err));
    }
    // Empty titles and bad colours
    {
        Error err;
        assert(!SlideDeck::create(props(), { makeContentSlide("", "Hello") }, -1, &err));
        TextBlock body; body.runs.push_back(TextRun{"red", TextFormatting{false, false, "red", 0}, QString()});
        assert(!SlideDeck::create(props(), { std::make_shared<ContentSlide>("Colour", body) }, -1, &err));
        assert(err.message.contains("#RRGGBB"));
    }
    // A valid deck keeps order
    {
        auto deck = SlideDeck::create(props(), {
            makeTitleSlide("Welcome", "Subtitle"),
            makeContentSlide("Agenda", "Text", {"One","Two"}),
            makeTwoColumnSlide("Compare", {"L1"}, {"R1"}) }, 3);
        assert(deck);
        assert(deck->slideCount() == 3);
        assert(deck->slide(0).kind() == SlideKind::Title);
        assert(deck->slide(1).title() == "Agenda");
        assert(deck->slide(2).kind() == SlideKind::TwoColumns);
    }
    // JSON: kind detection follows chart, table, image, layout hint
    {
        const QByteArray json = R"({
            "title": "Deck", "slide_count": 5,
            "slides": [
                {"title": "Chart", "chart": {"categories": ["a","b"], "series": [{"name": "s", "data": [1, 2]}]}, "table": {"headers": ["x"], "rows": [["1"]]}},
                {"title": "Table", "table": {"headers": ["x", "y"], "rows": [[1.5, "two"]]}},
                {"title": "Picture", "image": {"query": "mountains", "position": "left"}},
                {"title": "Hinted", "layout": "Two Columns", "left": ["a"], "right": ["b"]},
                {"title": "Text", "content": "plain"}
            ]})";
        Error err;
        auto deck = SlideDeck::fromJson(json, &err);
        assert(deck);
        assert(deck->slide(0).kind() == SlideKind::Chart);
        assert(static_cast<const ChartSlide &>(deck->slide(0)).chart().type == ChartType::Bar);
        assert(deck->slide(1).kind() == SlideKind::Table);
        const auto &table = static_cast<const TableSlide &>(deck->slide(1)).table();
        assert(table.rows[0][0] == "1.5");
        assert(deck->slide(2).kind() == SlideKind::ImageLeft);
        assert(static_cast<const ImageSlide &>(deck->slide(2)).image().query == "mountains");
        assert(deck->slide(3).kind() == SlideKind::TwoColumns);
        assert(deck->slide(4).kind() == SlideKind::ContentOnly);
        assert(deck->toJson().value("slides").toArray().size() == 5);
    }
    // JSON: configured default chart type, unknown types and missing title
    {
        const QByteArray chart = R"({"title": "D", "slides": [{"title": "C", "chart": {"categories": ["a"], "series": [{"name": "s", "data": [1]}]}}]})";
        auto deck = SlideDeck::fromJson(chart, nullptr, ChartType::Line);
        assert(deck);
        assert(static_cast<const ChartSlide &>(deck->slide(0)).chart().type == ChartType::Line);

        Error err;
        const QByteArray bad = R"({"title": "D", "slides": [{"title": "C", "chart": {"type": "radar", "categories": ["a"], "series": [{"name": "s", "data": [1]}]}}]})";
        assert(!SlideDeck::fromJson(bad, &err));
        assert(err.code == ErrorCode::SchemaValidation && err.slideIndex == 0);
        assert(!SlideDeck::fromJson(R"({"slides": []})", &err));
        assert(!SlideDeck::fromJson("not json", &err));
    }
    // Declared counts must be whole and non-negative
    {
        Error err;
        const QByteArray negative = R"({"title": "D", "slide_count": -1, "slides": [{"title": "A", "content": "x"}]})";
        assert(!SlideDeck::fromJson(negative, &err));
        assert(err.code == ErrorCode::SchemaValidation);
        assert(err.message.contains("slide_count"));
        const QByteArray fractional = R"({"title": "D", "slide_count": 2.5, "slides": [{"title": "A", "content": "x"}, {"title": "B", "content": "y"}]})";
        assert(!SlideDeck::fromJson(fractional, &err));
        assert(err.message.contains("slide_count"));
        assert(!SlideDeck::fromJson(R"({"title": "D", "slide_count": "1", "slides": [{"title": "A"}]})", &err));
        assert(SlideDeck::fromJson(R"({"title": "D", "slide_count": 1, "slides": [{"title": "A", "content": "x"}]})"));

        assert(!SlideDeck::create(props(), { makeContentSlide("Intro", "Hello") }, -7, &err));
        assert(err.code == ErrorCode::SchemaValidation);
        assert(err.message.contains("-7"));
    }
    // Font sizes stay within what a slide can hold
    {
        Error err;
        auto sized = [](double pt){
            TextBlock body; body.runs.push_back(TextRun{"sized", TextFormatting{false, false, QString(), pt}, QString()});
            return std::make_shared<ContentSlide>("Sizes", body);
        };
        assert(!SlideDeck::create(props(), { sized(1e12) }, 1, &err));
        assert(err.code == ErrorCode::SchemaValidation);
        assert(err.message.contains("font size"));
        assert(!SlideDeck::create(props(), { sized(5000) }, 1, &err));
        assert(!SlideDeck::create(props(), { sized(0.5) }, 1, &err));
        assert(!SlideDeck::create(props(), { sized(-3) }, 1, &err));
        assert(SlideDeck::create(props(), { sized(0) }, 1));
        assert(SlideDeck::create(props(), { sized(18) }, 1));

        TextBlock bullets;
        bullets.bullets.push_back(BulletPoint{"big", 0, TextFormatting{true, false, QString(), 9000}});
        assert(!SlideDeck::create(props(), { std::make_shared<ContentSlide>("Bullets", bullets) }, 1, &err));
    }
    // Characters XML cannot carry are rejected wherever text is accepted
    {
        Error err;
        const QString bell = QStringLiteral("a") + QChar(0x07) + QStringLiteral("b");
        assert(!SlideDeck::create(props(), { makeContentSlide(bell, "Hello") }, 1, &err));
        assert(err.code == ErrorCode::SchemaValidation);
        assert(err.message.contains("not allowed in XML"));
        assert(!SlideDeck::create(props(), { makeTableSlide("Grid", QStringList{"A"}, std::vector<QStringList>{QStringList{bell}}) }, 1, &err));
        assert(err.slideIndex == 0);
        assert(!SlideDeck::create(props(), { makeChartSlide("C", ChartType::Bar, {bell}, { {"s", {1}} }) }, 1, &err));
        assert(!SlideDeck::create(props(), { makeChartSlide("C", ChartType::Bar, {"a"}, { {bell, {1}} }) }, 1, &err));
        assert(!SlideDeck::create(props(), { makeContentSlide("Intro", "x", {bell}) }, 1, &err));
        const QString lone = QStringLiteral("x") + QChar(0xD800);
        assert(!SlideDeck::create(props(), { makeContentSlide("Intro", lone) }, 1, &err));

        DeckProperties badProps = props();
        badProps.author = bell;
        assert(!SlideDeck::create(badProps, { makeContentSlide("Intro", "Hello") }, 1, &err));
        assert(err.message.contains("author"));

        const QByteArray json = R"({"title": "D", "slides": [{"title": "T", "table": {"headers": ["a\u0001b"], "rows": [["1"]]}}]})";
        assert(!SlideDeck::fromJson(json, &err));
        assert(err.code == ErrorCode::SchemaValidation);

        const QString tabbed = QStringLiteral("col\tone\nline two \U0001F600");
        assert(SlideDeck::create(props(), { makeContentSlide("Intro", tabbed) }, 1));
    }
    // Table and chart slides keep their text and it is validated like any other body
    {
        const QByteArray json = R"({"title": "D", "slides": [
            {"title": "T", "content": "Beside the table", "table": {"headers": ["a"], "rows": [["1"]]}},
            {"title": "C", "bullet_points": ["Beside the chart"], "chart": {"categories": ["a"], "series": [{"name": "s", "data": [1]}]}}]})";
        auto deck = SlideDeck::fromJson(json);
        assert(deck);
        const auto &table = static_cast<const TableSlide &>(deck->slide(0));
        assert(table.body().runs.size() == 1 && table.body().runs[0].text == "Beside the table");
        const auto &chart = static_cast<const ChartSlide &>(deck->slide(1));
        assert(chart.body().bullets.size() == 1 && chart.body().bullets[0].text == "Beside the chart");
        const QJsonArray slides = deck->toJson().value("slides").toArray();
        assert(slides.at(0).toObject().contains("content"));
        assert(slides.at(1).toObject().value("bullet_points").toArray().size() == 1);

        Error err;
        const QByteArray badColour = R"({"title": "D", "slides": [
            {"title": "T", "content": [{"text": "x", "formatting": {"color": "blue"}}], "table": {"headers": ["a"], "rows": [["1"]]}}]})";
        assert(!SlideDeck::fromJson(badColour, &err));
        assert(err.code == ErrorCode::SchemaValidation);
    }
    std::cout << "slide_deck_validation_test passed" << std::endl; return 0;
}
