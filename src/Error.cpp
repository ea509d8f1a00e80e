#include "QtPptxTemplate/Error.hpp"

namespace QtPptxTemplate {

QString errorCodeName(ErrorCode code) {
    switch(code) {
    case ErrorCode::SchemaValidation: return QStringLiteral("SchemaValidationError");
    case ErrorCode::TemplateOpenFailed: return QStringLiteral("TemplateOpenFailed");
    case ErrorCode::TemplateCatalog: return QStringLiteral("TemplateCatalogError");
    case ErrorCode::ChartDataMismatch: return QStringLiteral("ChartDataMismatchError");
    case ErrorCode::DocumentAssembly: return QStringLiteral("DocumentAssemblyError");
    }
    return QStringLiteral("UnknownError");
}

} // namespace QtPptxTemplate
