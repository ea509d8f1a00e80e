/** \file Builder.hpp
 *  Free helper functions to concisely create slide shared_ptr objects for SlideDeck::create().
 */
#pragma once
#include "QtPptxTemplate/Export.hpp"
#include "QtPptxTemplate/Slide.hpp"
#include <initializer_list>
#include <memory>

namespace QtPptxTemplate {

/** Plain paragraph text as a single unformatted run. */
inline TextBlock textBlock(const QString &text){ TextBlock b; b.runs.push_back(TextRun{text, std::nullopt, QString()}); return b; }

/** Level-0 bullets from item texts. */
QTPPTXTEMPLATE_EXPORT std::vector<BulletPoint> makeBullets(const QStringList &items);

QTPPTXTEMPLATE_EXPORT SlidePtr makeTitleSlide(const QString &headline, const QString &subtitle = QString());
QTPPTXTEMPLATE_EXPORT SlidePtr makeContentSlide(const QString &title, const QString &text);
/** Overload: body text followed by level-0 bullets. */
QTPPTXTEMPLATE_EXPORT SlidePtr makeContentSlide(const QString &title, const QString &text, const QStringList &bullets);
QTPPTXTEMPLATE_EXPORT SlidePtr makeImageSlide(SlideKind kind, const QString &title, const QString &query,
                                              const QString &text = QString(), const QString &fallbackPath = QString());

/** Table from headers and rows. Row lengths are checked later by SlideDeck::create(). */
QTPPTXTEMPLATE_EXPORT SlidePtr makeTableSlide(const QString &title, const QStringList &headers,
                                              std::initializer_list<QStringList> rows, const QString &style = QString());
QTPPTXTEMPLATE_EXPORT SlidePtr makeTableSlide(const QString &title, const QStringList &headers,
                                              const std::vector<QStringList> &rows, const QString &style = QString());

/** Convenience structure for chart series specification. */
struct SeriesSpec { QString name; std::vector<double> values; };

/** Optional text is placed beside the chart. */
QTPPTXTEMPLATE_EXPORT SlidePtr makeChartSlide(const QString &title, ChartType type, const QStringList &categories,
                                              std::initializer_list<SeriesSpec> series, const QString &text = QString());
QTPPTXTEMPLATE_EXPORT SlidePtr makeTwoColumnSlide(const QString &title, const QStringList &left, const QStringList &right);

} // namespace QtPptxTemplate
