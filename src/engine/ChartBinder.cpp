#include "engine/ChartBinder.hpp"
#include "engine/SlideDraft.hpp"
#include <QLocale>
#include <sstream>

namespace QtPptxTemplate { namespace engine {

namespace {

constexpr const char *kChartUri = "http://schemas.openxmlformats.org/drawingml/2006/chart";
constexpr int kCategoryAxisId = 1001;
constexpr int kValueAxisId = 1002;

void val(pugi::xml_node parent, const char *name, const char *v) { parent.append_child(name).append_attribute("val") = v; }
void val(pugi::xml_node parent, const char *name, int v) { parent.append_child(name).append_attribute("val") = v; }

void appendCategories(pugi::xml_node ser, const QStringList &categories) {
    auto lit = ser.append_child("c:cat").append_child("c:strLit");
    val(lit, "c:ptCount", categories.size());
    for(int i = 0; i < categories.size(); ++i) {
        auto pt = lit.append_child("c:pt");
        pt.append_attribute("idx") = i;
        pt.append_child("c:v").text().set(categories[i].toUtf8().constData());
    }
}

void appendValues(pugi::xml_node ser, const std::vector<double> &values) {
    auto lit = ser.append_child("c:val").append_child("c:numLit");
    lit.append_child("c:formatCode").text().set("General");
    val(lit, "c:ptCount", static_cast<int>(values.size()));
    for(size_t i = 0; i < values.size(); ++i) {
        auto pt = lit.append_child("c:pt");
        pt.append_attribute("idx") = static_cast<int>(i);
        const QString v = QString::number(values[i], 'g', QLocale::FloatingPointShortest);
        pt.append_child("c:v").text().set(v.toUtf8().constData());
    }
}

void appendAxes(pugi::xml_node plotArea) {
    auto cat = plotArea.append_child("c:catAx");
    val(cat, "c:axId", kCategoryAxisId);
    val(cat.append_child("c:scaling"), "c:orientation", "minMax");
    val(cat, "c:delete", 0);
    val(cat, "c:axPos", "b");
    val(cat, "c:majorTickMark", "out");
    val(cat, "c:minorTickMark", "none");
    val(cat, "c:tickLblPos", "nextTo");
    val(cat, "c:crossAx", kValueAxisId);
    val(cat, "c:crosses", "autoZero");
    val(cat, "c:auto", 1);
    val(cat, "c:lblAlgn", "ctr");
    val(cat, "c:lblOffset", 100);
    val(cat, "c:noMultiLvlLbl", 0);

    auto v = plotArea.append_child("c:valAx");
    val(v, "c:axId", kValueAxisId);
    val(v.append_child("c:scaling"), "c:orientation", "minMax");
    val(v, "c:delete", 0);
    val(v, "c:axPos", "l");
    v.append_child("c:majorGridlines");
    auto fmt = v.append_child("c:numFmt");
    fmt.append_attribute("formatCode") = "General";
    fmt.append_attribute("sourceLinked") = 0;
    val(v, "c:majorTickMark", "out");
    val(v, "c:minorTickMark", "none");
    val(v, "c:tickLblPos", "nextTo");
    val(v, "c:crossAx", kCategoryAxisId);
    val(v, "c:crosses", "autoZero");
    val(v, "c:crossBetween", "between");
}

} // namespace

std::optional<QByteArray> buildChartPart(const ChartData &chart, const QString &language, Error *error) {
    for(const auto &s : chart.series) {
        if(static_cast<int>(s.values.size()) != chart.categories.size()) {
            setError(error, ErrorCode::ChartDataMismatch,
                     QStringLiteral("series '%1' has %2 values for %3 categories")
                         .arg(s.name).arg(s.values.size()).arg(chart.categories.size()));
            return std::nullopt;
        }
    }

    pugi::xml_document doc;
    auto decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";
    decl.append_attribute("standalone") = "yes";
    auto space = doc.append_child("c:chartSpace");
    space.append_attribute("xmlns:c") = ns::c;
    space.append_attribute("xmlns:a") = ns::a;
    space.append_attribute("xmlns:r") = ns::r;
    val(space, "c:date1904", 0);
    val(space, "c:lang", language.toUtf8().constData());
    val(space, "c:roundedCorners", 0);

    auto c = space.append_child("c:chart");
    val(c, "c:autoTitleDeleted", 1);
    auto plotArea = c.append_child("c:plotArea");
    plotArea.append_child("c:layout");

    pugi::xml_node group;
    switch(chart.type) {
    case ChartType::Bar:
        group = plotArea.append_child("c:barChart");
        val(group, "c:barDir", "col");
        val(group, "c:grouping", "clustered");
        val(group, "c:varyColors", 0);
        break;
    case ChartType::Line:
        group = plotArea.append_child("c:lineChart");
        val(group, "c:grouping", "standard");
        val(group, "c:varyColors", 0);
        break;
    case ChartType::Pie:
        group = plotArea.append_child("c:pieChart");
        val(group, "c:varyColors", 1);
        break;
    }

    for(size_t i = 0; i < chart.series.size(); ++i) {
        const auto &s = chart.series[i];
        auto ser = group.append_child("c:ser");
        val(ser, "c:idx", static_cast<int>(i));
        val(ser, "c:order", static_cast<int>(i));
        ser.append_child("c:tx").append_child("c:v").text().set(s.name.toUtf8().constData());
        if(chart.type == ChartType::Bar) val(ser, "c:invertIfNegative", 0);
        if(chart.type == ChartType::Line) val(ser.append_child("c:marker"), "c:symbol", "circle");
        appendCategories(ser, chart.categories);
        appendValues(ser, s.values);
        if(chart.type == ChartType::Line) val(ser, "c:smooth", 0);
    }

    switch(chart.type) {
    case ChartType::Bar:
        val(group, "c:gapWidth", 150);
        break;
    case ChartType::Line:
        val(group, "c:marker", 1);
        break;
    case ChartType::Pie:
        val(group, "c:firstSliceAng", 0);
        break;
    }
    if(chart.type != ChartType::Pie) {
        val(group, "c:axId", kCategoryAxisId);
        val(group, "c:axId", kValueAxisId);
        appendAxes(plotArea);
    }

    auto legend = c.append_child("c:legend");
    val(legend, "c:legendPos", chart.type == ChartType::Pie ? "r" : "b");
    val(legend, "c:overlay", 0);
    val(c, "c:plotVisOnly", 1);
    val(c, "c:dispBlanksAs", "gap");

    std::ostringstream ss;
    doc.save(ss, "", pugi::format_raw, pugi::encoding_utf8);
    const std::string s = ss.str();
    return QByteArray(s.data(), static_cast<qsizetype>(s.size()));
}

bool bindChart(SlideDraft &draft, const ShapeTarget &target, const ChartData &chart, Error *error) {
    auto part = buildChartPart(chart, draft.language(), error);
    if(!part) return false;
    const QString relId = draft.addChart(*part);

    const unsigned id = draft.nextShapeId();
    const Placeholder *ph = target.placeholder;
    auto frame = draft.spTree().append_child("p:graphicFrame");
    auto nv = frame.append_child("p:nvGraphicFramePr");
    appendCNvPr(nv, id, ph && !ph->name.isEmpty() ? ph->name : QStringLiteral("Chart %1").arg(id - 1));
    nv.append_child("p:cNvGraphicFramePr").append_child("a:graphicFrameLocks").append_attribute("noGrp") = 1;
    auto nvPr = nv.append_child("p:nvPr");
    if(ph) appendPlaceholderRef(nvPr, *ph);
    appendXfrm(frame, "p:xfrm", target.rect());

    auto graphicData = frame.append_child("a:graphic").append_child("a:graphicData");
    graphicData.append_attribute("uri") = kChartUri;
    auto ref = graphicData.append_child("c:chart");
    ref.append_attribute("xmlns:c") = ns::c;
    ref.append_attribute("r:id") = relId.toUtf8().constData();
    return true;
}

}} // namespace QtPptxTemplate::engine
