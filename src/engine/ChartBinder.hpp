/** \file ChartBinder.hpp
 *  Native chart support: a chart part (<c:chartSpace> with literal data) and the graphic
 *  frame that references it from the slide.
 */
#pragma once
#include "QtPptxTemplate/Error.hpp"
#include "engine/ShapeXml.hpp"
#include <QByteArray>

namespace QtPptxTemplate { namespace engine {

class SlideDraft;

/** Serialize the chart part. Fails with ChartDataMismatch when a series length differs from
 *  the category count. */
std::optional<QByteArray> buildChartPart(const ChartData &chart, const QString &language, Error *error = nullptr);

/** Add the chart to the draft and place its frame. Returns false on ChartDataMismatch. */
bool bindChart(SlideDraft &draft, const ShapeTarget &target, const ChartData &chart, Error *error = nullptr);

}} // namespace QtPptxTemplate::engine
