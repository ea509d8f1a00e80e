#include "engine/TableBinder.hpp"
#include "engine/SlideDraft.hpp"
#include "util/Logging.hpp"
#include <algorithm>

namespace QtPptxTemplate { namespace engine {

namespace {

constexpr const char *kTableUri = "http://schemas.openxmlformats.org/drawingml/2006/table";
constexpr const char *kMediumStyle2Accent1 = "{5C22544A-7EE6-4342-B048-85BDC9FD1C3A}";
constexpr qint64 kMinRowHeight = 370840;

void appendCell(SlideDraft &draft, pugi::xml_node tr, const QString &text, bool header, bool colored) {
    auto tc = tr.append_child("a:tc");
    auto txBody = tc.append_child("a:txBody");
    txBody.append_child("a:bodyPr");
    txBody.append_child("a:lstStyle");
    auto p = txBody.append_child("a:p");
    if(text.isEmpty()) {
        p.append_child("a:endParaRPr").append_attribute("lang") = draft.language().toUtf8().constData();
    } else {
        std::optional<TextFormatting> fmt;
        if(header) {
            TextFormatting f;
            f.bold = true;
            if(colored) f.color = QStringLiteral("#FFFFFF");
            fmt = f;
        }
        appendRun(p, text, draft.language(), fmt);
    }
    auto tcPr = tc.append_child("a:tcPr");
    if(header && colored)
        tcPr.append_child("a:solidFill").append_child("a:srgbClr").append_attribute("val") = "003366";
}

} // namespace

TableShape bindTable(SlideDraft &draft, const ShapeTarget &target, const TableData &table) {
    TableShape shape;
    shape.rows = static_cast<int>(table.rows.size()) + 1;
    shape.columns = table.columnCount();
    const Placeholder *ph = target.placeholder;
    if(ph && ph->gridRows > 0 && ph->gridColumns > 0 && (shape.rows != ph->gridRows || shape.columns != ph->gridColumns))
        qCWarning(lcRender, "Table %dx%d replaces template grid %dx%d", shape.rows, shape.columns, ph->gridRows, ph->gridColumns);

    const Rect rect = target.rect();
    const unsigned id = draft.nextShapeId();
    auto frame = draft.spTree().append_child("p:graphicFrame");
    auto nv = frame.append_child("p:nvGraphicFramePr");
    appendCNvPr(nv, id, ph && !ph->name.isEmpty() ? ph->name : QStringLiteral("Table %1").arg(id - 1));
    nv.append_child("p:cNvGraphicFramePr").append_child("a:graphicFrameLocks").append_attribute("noGrp") = 1;
    auto nvPr = nv.append_child("p:nvPr");
    if(ph) appendPlaceholderRef(nvPr, *ph);
    appendXfrm(frame, "p:xfrm", rect);

    auto graphicData = frame.append_child("a:graphic").append_child("a:graphicData");
    graphicData.append_attribute("uri") = kTableUri;
    auto tbl = graphicData.append_child("a:tbl");
    auto tblPr = tbl.append_child("a:tblPr");
    tblPr.append_attribute("firstRow") = 1;
    tblPr.append_attribute("bandRow") = 1;
    tblPr.append_child("a:tableStyleId").text().set(kMediumStyle2Accent1);

    auto grid = tbl.append_child("a:tblGrid");
    const qint64 colWidth = shape.columns > 0 ? rect.cx / shape.columns : 0;
    for(int c = 0; c < shape.columns; ++c) grid.append_child("a:gridCol").append_attribute("w") = static_cast<long long>(colWidth);

    const qint64 rowHeight = std::max(kMinRowHeight, shape.rows > 0 ? rect.cy / shape.rows : 0);
    const bool colored = table.style == QLatin1String("header_colored");
    for(int r = 0; r < shape.rows; ++r) {
        auto tr = tbl.append_child("a:tr");
        tr.append_attribute("h") = static_cast<long long>(rowHeight);
        const QStringList &cells = r == 0 ? table.headers : table.rows[static_cast<size_t>(r - 1)];
        for(const auto &text : cells) appendCell(draft, tr, text, r == 0, colored);
    }
    return shape;
}

}} // namespace QtPptxTemplate::engine
