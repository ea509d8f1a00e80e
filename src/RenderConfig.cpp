#include "QtPptxTemplate/RenderConfig.hpp"
#include "util/Logging.hpp"
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QtGlobal>

namespace QtPptxTemplate {

int RenderConfig::characterBudget(PlaceholderRole role) const {
    switch(role) {
    case PlaceholderRole::Title: return titleCharBudget;
    case PlaceholderRole::ColumnLeft:
    case PlaceholderRole::ColumnRight: return columnCharBudget;
    default: return bodyCharBudget;
    }
}

namespace {

bool readPositive(const QJsonObject &o, const char *key, int &target, QString *errorMessage) {
    const auto v = o.value(QLatin1String(key));
    if(v.isUndefined()) return true;
    if(!v.isDouble() || v.toInt(-1) <= 0) {
        if(errorMessage) *errorMessage = QStringLiteral("'%1' must be a positive integer").arg(QLatin1String(key));
        return false;
    }
    target = v.toInt();
    return true;
}

void readString(const QJsonObject &o, const char *key, QString &target) {
    const auto v = o.value(QLatin1String(key));
    if(v.isString()) target = v.toString();
}

} // namespace

std::optional<RenderConfig> RenderConfig::fromJsonFile(const QString &path, QString *errorMessage) {
    QFile f(path);
    if(!f.open(QIODevice::ReadOnly)) {
        if(errorMessage) *errorMessage = QStringLiteral("cannot open %1: %2").arg(path, f.errorString());
        return std::nullopt;
    }
    QJsonParseError perr;
    const auto doc = QJsonDocument::fromJson(f.readAll(), &perr);
    if(perr.error != QJsonParseError::NoError || !doc.isObject()) {
        if(errorMessage) *errorMessage = QStringLiteral("%1 is not a JSON object: %2").arg(path, perr.errorString());
        return std::nullopt;
    }
    const QJsonObject o = doc.object();
    RenderConfig c;
    readString(o, "template", c.templatePath);
    readString(o, "fallback_image", c.fallbackImagePath);
    readString(o, "image_endpoint", c.imageEndpoint);
    readString(o, "image_access_key", c.imageAccessKey);
    if(!readPositive(o, "image_timeout_ms", c.imageTimeoutMs, errorMessage)) return std::nullopt;
    if(!readPositive(o, "image_workers", c.imageWorkers, errorMessage)) return std::nullopt;

    const QJsonObject budgets = o.value(QLatin1String("budgets")).toObject();
    if(!readPositive(budgets, "title", c.titleCharBudget, errorMessage)) return std::nullopt;
    if(!readPositive(budgets, "subtitle", c.subtitleCharBudget, errorMessage)) return std::nullopt;
    if(!readPositive(budgets, "body", c.bodyCharBudget, errorMessage)) return std::nullopt;
    if(!readPositive(budgets, "column", c.columnCharBudget, errorMessage)) return std::nullopt;

    const QJsonObject fit = o.value(QLatin1String("autofit")).toObject();
    if(!readPositive(fit, "step_percent", c.autoFit.stepPercent, errorMessage)) return std::nullopt;
    if(!readPositive(fit, "floor_percent", c.autoFit.floorPercent, errorMessage)) return std::nullopt;
    if(c.autoFit.floorPercent > 100) {
        if(errorMessage) *errorMessage = QStringLiteral("'floor_percent' must not exceed 100");
        return std::nullopt;
    }
    readString(fit, "truncation_marker", c.autoFit.truncationMarker);

    const auto chart = o.value(QLatin1String("default_chart_type"));
    if(chart.isString()) {
        auto t = chartTypeFromString(chart.toString());
        if(!t) {
            if(errorMessage) *errorMessage = QStringLiteral("unknown chart type '%1'").arg(chart.toString());
            return std::nullopt;
        }
        c.defaultChartType = *t;
    }
    return c;
}

void RenderConfig::applyEnvironment() {
    if(qEnvironmentVariableIsSet("QTPPTX_TEMPLATE")) templatePath = qEnvironmentVariable("QTPPTX_TEMPLATE");
    if(qEnvironmentVariableIsSet("QTPPTX_FALLBACK_IMAGE")) fallbackImagePath = qEnvironmentVariable("QTPPTX_FALLBACK_IMAGE");
    if(qEnvironmentVariableIsSet("UNSPLASH_ACCESS_KEY")) imageAccessKey = qEnvironmentVariable("UNSPLASH_ACCESS_KEY");
    bool ok = false;
    if(qEnvironmentVariableIsSet("QTPPTX_IMAGE_TIMEOUT_MS")) {
        const int v = qEnvironmentVariableIntValue("QTPPTX_IMAGE_TIMEOUT_MS", &ok);
        if(ok && v > 0) imageTimeoutMs = v;
        else qCWarning(lcRender, "Ignoring invalid QTPPTX_IMAGE_TIMEOUT_MS");
    }
    if(qEnvironmentVariableIsSet("QTPPTX_IMAGE_WORKERS")) {
        const int v = qEnvironmentVariableIntValue("QTPPTX_IMAGE_WORKERS", &ok);
        if(ok && v > 0) imageWorkers = v;
        else qCWarning(lcRender, "Ignoring invalid QTPPTX_IMAGE_WORKERS");
    }
}

} // namespace QtPptxTemplate
