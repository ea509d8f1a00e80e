/** \file Error.hpp
 *  Error value reported by validation, catalog loading and rendering.
 *  Recovered conditions (missing layout, failed image fetch) are not errors; they are
 *  reported as metadata on the RenderedDeck.
 */
#pragma once
#include "QtPptxTemplate/Export.hpp"
#include <QString>

namespace QtPptxTemplate {

enum class ErrorCode {
    SchemaValidation,   ///< malformed deck description, rejected before rendering
    TemplateOpenFailed, ///< template package missing or not a zip
    TemplateCatalog,    ///< template has no usable ContentOnly layout
    ChartDataMismatch,  ///< series length differs from category count at bind time
    DocumentAssembly    ///< package serialization fault
};

/** Failure description. slideIndex is -1 when the failure is not tied to one slide. */
struct Error {
    ErrorCode code{ErrorCode::SchemaValidation};
    QString message;
    int slideIndex{-1};
};

QTPPTXTEMPLATE_EXPORT QString errorCodeName(ErrorCode code);

/** Store an error into an optional out-parameter. */
inline void setError(Error *out, ErrorCode code, const QString &message, int slideIndex = -1) {
    if(out) *out = Error{code, message, slideIndex};
}

} // namespace QtPptxTemplate
