/** \file RenderedDeck.hpp
 *  Result of one render: package bytes plus the metadata reported to the caller.
 */
#pragma once
#include "QtPptxTemplate/Export.hpp"
#include "QtPptxTemplate/Slide.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <vector>

namespace QtPptxTemplate {

enum class ImageSource { Provider, LocalFile, Fallback };
QTPPTXTEMPLATE_EXPORT QString imageSourceName(ImageSource source);

/** Slide rendered with the ContentOnly layout because its own kind had none. */
struct DegradedSlide {
    int slideIndex{-1};
    SlideKind requestedKind{SlideKind::ContentOnly};
};

struct SlideImageInfo {
    int slideIndex{-1};
    QString query;
    ImageSource source{ImageSource::Fallback};
};

struct QTPPTXTEMPLATE_EXPORT RenderedDeck {
    QByteArray package;
    QJsonObject structure;
    QString filename;
    int slideCount{0};
    std::vector<DegradedSlide> degradedSlides;
    std::vector<SlideImageInfo> images;

    bool isDegraded(int slideIndex) const;
    /** {filename, slide_count, degraded_slides, images, structure} */
    QJsonObject metadata() const;
    bool save(const QString &path) const;
};

/** Keep alphanumerics, space, '-', '_' and '.', ensure a .pptx suffix. */
QTPPTXTEMPLATE_EXPORT QString sanitizeFilename(const QString &hint);

} // namespace QtPptxTemplate
