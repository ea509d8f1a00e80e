#include "engine/ImageBinder.hpp"
#include "engine/SlideDraft.hpp"
#include <cmath>

namespace QtPptxTemplate { namespace engine {

CropInsets centerCrop(const QSize &imageSize, const Rect &frame) {
    CropInsets crop;
    if(imageSize.isEmpty() || frame.isEmpty()) return crop;
    const double imageAspect = static_cast<double>(imageSize.width()) / imageSize.height();
    const double frameAspect = static_cast<double>(frame.cx) / static_cast<double>(frame.cy);
    if(std::abs(imageAspect - frameAspect) < 1e-6) return crop;
    if(imageAspect > frameAspect) {
        const int side = static_cast<int>(std::lround((1.0 - frameAspect / imageAspect) * 50000.0));
        crop.left = crop.right = side;
    } else {
        const int side = static_cast<int>(std::lround((1.0 - imageAspect / frameAspect) * 50000.0));
        crop.top = crop.bottom = side;
    }
    return crop;
}

void bindImage(SlideDraft &draft, const ShapeTarget &target, const DecodedImage &image, const QString &description) {
    const QString relId = draft.addImage(image);
    const Rect rect = target.rect();
    const unsigned id = draft.nextShapeId();
    const Placeholder *ph = target.placeholder;

    auto pic = draft.spTree().append_child("p:pic");
    auto nv = pic.append_child("p:nvPicPr");
    appendCNvPr(nv, id, ph && !ph->name.isEmpty() ? ph->name : QStringLiteral("Picture %1").arg(id - 1), description);
    auto locks = nv.append_child("p:cNvPicPr").append_child("a:picLocks");
    if(ph) locks.append_attribute("noGrp") = 1;
    locks.append_attribute("noChangeAspect") = 1;
    auto nvPr = nv.append_child("p:nvPr");
    if(ph) appendPlaceholderRef(nvPr, *ph);

    auto blipFill = pic.append_child("p:blipFill");
    blipFill.append_child("a:blip").append_attribute("r:embed") = relId.toUtf8().constData();
    const CropInsets crop = centerCrop(image.size, rect);
    if(!crop.isNull()) {
        auto src = blipFill.append_child("a:srcRect");
        if(crop.left) src.append_attribute("l") = crop.left;
        if(crop.top) src.append_attribute("t") = crop.top;
        if(crop.right) src.append_attribute("r") = crop.right;
        if(crop.bottom) src.append_attribute("b") = crop.bottom;
    }
    blipFill.append_child("a:stretch").append_child("a:fillRect");

    auto spPr = pic.append_child("p:spPr");
    appendXfrm(spPr, "a:xfrm", rect);
    auto geom = spPr.append_child("a:prstGeom");
    geom.append_attribute("prst") = "rect";
    geom.append_child("a:avLst");
}

}} // namespace QtPptxTemplate::engine
