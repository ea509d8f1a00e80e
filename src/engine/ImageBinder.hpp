/** \file ImageBinder.hpp
 *  Places a decoded image into a picture placeholder or an explicit frame, center-cropped to
 *  the frame's aspect ratio.
 */
#pragma once
#include "engine/ShapeXml.hpp"
#include <QSize>

namespace QtPptxTemplate {
struct DecodedImage;
}

namespace QtPptxTemplate { namespace engine {

class SlideDraft;

/** <a:srcRect> insets in 1/1000 of a percent. */
struct CropInsets {
    int left{0};
    int top{0};
    int right{0};
    int bottom{0};
    bool isNull() const { return left == 0 && top == 0 && right == 0 && bottom == 0; }
};

/** Symmetric crop that makes an image of imageSize fill frame without distortion. */
CropInsets centerCrop(const QSize &imageSize, const Rect &frame);

void bindImage(SlideDraft &draft, const ShapeTarget &target, const DecodedImage &image, const QString &description);

}} // namespace QtPptxTemplate::engine
