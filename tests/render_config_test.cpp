// Render configuration from JSON files and the environment
#include "QtPptxTemplate/RenderConfig.hpp"
#include <QFile>
#include <QTemporaryDir>
#include <cassert>
#include <iostream>

using namespace QtPptxTemplate;

static QString writeFile(const QTemporaryDir &dir, const QString &name, const QByteArray &content){
    const QString path = dir.path() + "/" + name;
    QFile f(path); bool ok = f.open(QIODevice::WriteOnly); assert(ok); f.write(content); f.close();
    return path;
}

int main(){
    QTemporaryDir dir; assert(dir.isValid());
    // Defaults
    {
        RenderConfig c;
        assert(c.imageTimeoutMs == 5000 && c.imageWorkers == 4);
        assert(c.characterBudget(PlaceholderRole::Title) == 120);
        assert(c.characterBudget(PlaceholderRole::Body) == 500);
        assert(c.characterBudget(PlaceholderRole::ColumnRight) == 250);
        assert(c.subtitleCharBudget == 200);
        assert(c.autoFit.stepPercent == 10 && c.autoFit.floorPercent == 50);
        assert(c.autoFit.truncationMarker == QString(QChar(0x2026)));
        assert(c.defaultChartType == ChartType::Bar);
    }
    // File overrides keep unspecified defaults
    {
        const QString path = writeFile(dir, "render.json", R"({
            "template": "/srv/templates/corporate.pptx",
            "image_timeout_ms": 1500,
            "budgets": {"body": 800, "column": 300},
            "autofit": {"floor_percent": 60, "truncation_marker": "..."},
            "default_chart_type": "line"})");
        QString msg;
        auto c = RenderConfig::fromJsonFile(path, &msg);
        assert(c);
        assert(c->templatePath == "/srv/templates/corporate.pptx");
        assert(c->imageTimeoutMs == 1500);
        assert(c->imageWorkers == 4);
        assert(c->bodyCharBudget == 800 && c->columnCharBudget == 300 && c->titleCharBudget == 120);
        assert(c->autoFit.floorPercent == 60 && c->autoFit.stepPercent == 10);
        assert(c->autoFit.truncationMarker == "...");
        assert(c->defaultChartType == ChartType::Line);
    }
    // Invalid files
    {
        QString msg;
        assert(!RenderConfig::fromJsonFile(dir.path() + "/missing.json", &msg));
        assert(msg.contains("missing.json"));
        assert(!RenderConfig::fromJsonFile(writeFile(dir, "bad.json", "[1,2]"), &msg));
        assert(!RenderConfig::fromJsonFile(writeFile(dir, "neg.json", R"({"image_workers": 0})"), &msg));
        assert(msg.contains("image_workers"));
        assert(!RenderConfig::fromJsonFile(writeFile(dir, "chart.json", R"({"default_chart_type": "radar"})"), &msg));
    }
    // Environment overrides
    {
        qputenv("QTPPTX_TEMPLATE", "/env/template.pptx");
        qputenv("QTPPTX_IMAGE_TIMEOUT_MS", "750");
        qputenv("QTPPTX_IMAGE_WORKERS", "not-a-number");
        qputenv("UNSPLASH_ACCESS_KEY", "secret-key");
        RenderConfig c;
        c.applyEnvironment();
        assert(c.templatePath == "/env/template.pptx");
        assert(c.imageTimeoutMs == 750);
        assert(c.imageWorkers == 4);
        assert(c.imageAccessKey == "secret-key");
        qunsetenv("QTPPTX_TEMPLATE"); qunsetenv("QTPPTX_IMAGE_TIMEOUT_MS"); qunsetenv("QTPPTX_IMAGE_WORKERS"); qunsetenv("UNSPLASH_ACCESS_KEY");
    }
    std::cout << "render_config_test passed" << std::endl; return 0;
}
