#include <QtPptxTemplate/Presentation.hpp>
#include <QtPptxTemplate/RenderConfig.hpp>
#include <QtPptxTemplate/TemplateCatalog.hpp>
#include <QtPptxTemplate/UnsplashImageProvider.hpp>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <iostream>

// Renders a JSON deck description into a .pptx against a template and prints the metadata.
// Exit codes: 1 invalid input, 2 template unusable, 3 package could not be written.

using namespace QtPptxTemplate;

namespace {
int exitCodeFor(ErrorCode code){
    switch(code){
    case ErrorCode::SchemaValidation: return 1;
    case ErrorCode::TemplateOpenFailed:
    case ErrorCode::TemplateCatalog: return 2;
    case ErrorCode::ChartDataMismatch: return 1;
    case ErrorCode::DocumentAssembly: return 3;
    }
    return 3;
}

void report(const Error &e){
    std::cerr << qPrintable(errorCodeName(e.code));
    if(e.slideIndex >= 0) std::cerr << " (slide " << e.slideIndex << ")";
    std::cerr << ": " << qPrintable(e.message) << std::endl;
}
}

int main(int argc, char *argv[]){
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("pptx_render"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Render a JSON slide deck into a PowerPoint file."));
    parser.addHelpOption();
    QCommandLineOption templateOpt(QStringLiteral("template"), QStringLiteral("Template .pptx."), QStringLiteral("file"));
    QCommandLineOption configOpt(QStringLiteral("config"), QStringLiteral("Render configuration JSON."), QStringLiteral("file"));
    QCommandLineOption outOpt(QStringLiteral("out"), QStringLiteral("Output .pptx (default: sanitized deck title)."), QStringLiteral("file"));
    QCommandLineOption langOpt(QStringLiteral("language"), QStringLiteral("Language tag overriding the deck's."), QStringLiteral("tag"));
    parser.addOptions({templateOpt, configOpt, outOpt, langOpt});
    parser.addPositionalArgument(QStringLiteral("deck"), QStringLiteral("Deck description JSON."));
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if(args.size() != 1){
        parser.showHelp(1);
    }

    RenderConfig config;
    if(parser.isSet(configOpt)){
        QString msg;
        auto loaded = RenderConfig::fromJsonFile(parser.value(configOpt), &msg);
        if(!loaded){
            std::cerr << "config: " << qPrintable(msg) << std::endl;
            return 1;
        }
        config = *loaded;
    }
    config.applyEnvironment();
    if(parser.isSet(templateOpt)) config.templatePath = parser.value(templateOpt);

    QFile deckFile(args.first());
    if(!deckFile.open(QIODevice::ReadOnly)){
        std::cerr << "cannot open " << qPrintable(args.first()) << ": " << qPrintable(deckFile.errorString()) << std::endl;
        return 1;
    }
    const QByteArray json = deckFile.readAll();

    Error err;
    auto catalog = TemplateCatalog::load(config.templatePath, &err);
    if(!catalog){
        report(err);
        return 2;
    }

    Presentation pres(catalog, config);
    pres.setImageProvider(std::make_shared<UnsplashImageProvider>(config.imageAccessKey, config.imageEndpoint));
    const QString outPath = parser.value(outOpt);
    auto rendered = pres.renderJson(json, outPath.isEmpty() ? QString() : QFileInfo(outPath).fileName(), parser.value(langOpt));
    if(!rendered){
        const Error e = pres.lastError().value_or(Error{ErrorCode::DocumentAssembly, QStringLiteral("render failed"), -1});
        report(e);
        return exitCodeFor(e.code);
    }
    const QString target = outPath.isEmpty() ? rendered->filename : outPath;
    if(!rendered->save(target)){
        std::cerr << "cannot write " << qPrintable(target) << std::endl;
        return 3;
    }
    std::cout << QJsonDocument(rendered->metadata()).toJson(QJsonDocument::Indented).constData();
    return 0;
}
