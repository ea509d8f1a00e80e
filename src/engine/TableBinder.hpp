/** \file TableBinder.hpp
 *  Emits a DrawingML table (<a:tbl> inside a graphic frame) for TableData.
 */
#pragma once
#include "engine/ShapeXml.hpp"

namespace QtPptxTemplate { namespace engine {

class SlideDraft;

struct TableShape {
    int rows{0};    // including the header row
    int columns{0};
};

/** Header row plus one row per data row, one column per header cell. A fixed grid in the
 *  layout placeholder is replaced by the data's shape. */
TableShape bindTable(SlideDraft &draft, const ShapeTarget &target, const TableData &table);

}} // namespace QtPptxTemplate::engine
