/** \file RenderConfig.hpp
 *  Tunable rendering parameters. Defaults match a 16:9 corporate template; every value can
 *  be overridden from a JSON file and from the environment.
 */
#pragma once
#include "QtPptxTemplate/Export.hpp"
#include "QtPptxTemplate/Layout.hpp"
#include "QtPptxTemplate/Slide.hpp"
#include <QString>
#include <optional>

namespace QtPptxTemplate {

/** Text that exceeds its budget shrinks by stepPercent down to floorPercent, then is truncated. */
struct AutoFitPolicy {
    int stepPercent{10};
    int floorPercent{50};
    QString truncationMarker{QChar(0x2026)};
};

struct QTPPTXTEMPLATE_EXPORT RenderConfig {
    QString templatePath;
    QString fallbackImagePath;
    int imageTimeoutMs{5000};
    int imageWorkers{4};

    int titleCharBudget{120};
    int subtitleCharBudget{200};
    int bodyCharBudget{500};
    int columnCharBudget{250};
    AutoFitPolicy autoFit;

    ChartType defaultChartType{ChartType::Bar};

    QString imageEndpoint{QStringLiteral("https://api.unsplash.com")};
    QString imageAccessKey;

    /** Character budget for a placeholder role. */
    int characterBudget(PlaceholderRole role) const;

    /** Read overrides from a JSON object file. Missing keys keep their defaults. */
    static std::optional<RenderConfig> fromJsonFile(const QString &path, QString *errorMessage = nullptr);
    /** Apply QTPPTX_* and UNSPLASH_ACCESS_KEY environment overrides. */
    void applyEnvironment();
};

} // namespace QtPptxTemplate
