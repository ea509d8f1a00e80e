#include "engine/TextBinder.hpp"
#include "engine/SlideDraft.hpp"
#include "util/Logging.hpp"

namespace QtPptxTemplate { namespace engine {

namespace {

QString shapeName(const ShapeTarget &target, unsigned id) {
    if(target.placeholder && !target.placeholder->name.isEmpty()) return target.placeholder->name;
    if(target.placeholder && target.placeholder->role == PlaceholderRole::Title) return QStringLiteral("Title %1").arg(id - 1);
    return QStringLiteral("TextBox %1").arg(id - 1);
}

/** Lines of one run become runs separated by <a:br/>. */
void appendRunLines(SlideDraft &draft, pugi::xml_node p, const TextRun &run) {
    const QString rel = run.hyperlink.isEmpty() ? QString() : draft.addHyperlink(run.hyperlink);
    const QStringList lines = run.text.split(QLatin1Char('\n'));
    for(int i = 0; i < lines.size(); ++i) {
        if(i > 0) p.append_child("a:br").append_child("a:rPr").append_attribute("lang") = draft.language().toUtf8().constData();
        appendRun(p, lines[i], draft.language(), run.formatting, rel);
    }
}

void appendBullet(SlideDraft &draft, pugi::xml_node txBody, const BulletPoint &b, BulletStyle style) {
    auto p = txBody.append_child("a:p");
    auto pPr = p.append_child("a:pPr");
    if(b.level > 0) pPr.append_attribute("lvl") = b.level;
    if(style == BulletStyle::Numbered) pPr.append_child("a:buAutoNum").append_attribute("type") = "arabicPeriod";
    else pPr.append_child("a:buChar").append_attribute("char") = "\xE2\x80\xA2";
    appendRunLines(draft, p, TextRun{b.text, b.formatting, QString()});
}

} // namespace

pugi::xml_node TextBinder::makeShape(SlideDraft &draft, const ShapeTarget &target, const FitResult &fit) const {
    const unsigned id = draft.nextShapeId();
    auto sp = draft.spTree().append_child("p:sp");
    auto nv = sp.append_child("p:nvSpPr");
    appendCNvPr(nv, id, shapeName(target, id));
    auto cNvSpPr = nv.append_child("p:cNvSpPr");
    if(target.placeholder) cNvSpPr.append_child("a:spLocks").append_attribute("noGrp") = 1;
    else cNvSpPr.append_attribute("txBox") = 1;
    auto nvPr = nv.append_child("p:nvPr");
    if(target.placeholder) appendPlaceholderRef(nvPr, *target.placeholder);

    auto spPr = sp.append_child("p:spPr");
    if(target.bounds) appendXfrm(spPr, "a:xfrm", *target.bounds);
    if(!target.placeholder) {
        auto geom = spPr.append_child("a:prstGeom");
        geom.append_attribute("prst") = "rect";
        geom.append_child("a:avLst");
    }

    auto txBody = sp.append_child("p:txBody");
    auto bodyPr = txBody.append_child("a:bodyPr");
    if(!target.placeholder) bodyPr.append_attribute("wrap") = "square";
    auto autofit = bodyPr.append_child("a:normAutofit");
    if(fit.scalePercent < 100) autofit.append_attribute("fontScale") = fit.scalePercent * 1000;
    txBody.append_child("a:lstStyle");
    return txBody;
}

FitResult TextBinder::bindText(SlideDraft &draft, const ShapeTarget &target, const QString &text) const {
    FitResult fit = fitText(text.size(), m_budget, m_policy);
    QString shown = text;
    if(fit.truncated) shown = truncateText(text, fit.keepCharacters, m_policy.truncationMarker);
    auto txBody = makeShape(draft, target, fit);
    auto p = txBody.append_child("a:p");
    if(!shown.isEmpty()) appendRunLines(draft, p, TextRun{shown, std::nullopt, QString()});
    if(fit.truncated) qCWarning(lcRender, "Text of %d characters truncated to %d at %d%% scale", static_cast<int>(text.size()), fit.keepCharacters, fit.scalePercent);
    return fit;
}

FitResult TextBinder::bindBlock(SlideDraft &draft, const ShapeTarget &target, const TextBlock &block, BulletStyle style) const {
    FitResult fit = fitText(block.characterCount(), m_budget, m_policy);
    const TextBlock shown = fit.truncated ? truncateBlock(block, fit.keepCharacters, m_policy.truncationMarker) : block;
    auto txBody = makeShape(draft, target, fit);
    if(!shown.runs.empty()) {
        auto p = txBody.append_child("a:p");
        for(const auto &run : shown.runs) appendRunLines(draft, p, run);
    }
    for(const auto &b : shown.bullets) appendBullet(draft, txBody, b, style);
    if(!txBody.child("a:p")) txBody.append_child("a:p");
    if(fit.truncated) qCWarning(lcRender, "Body of %d characters truncated to %d at %d%% scale", block.characterCount(), fit.keepCharacters, fit.scalePercent);
    return fit;
}

FitResult TextBinder::bindBullets(SlideDraft &draft, const ShapeTarget &target, const std::vector<BulletPoint> &bullets, BulletStyle style) const {
    TextBlock block;
    block.bullets = bullets;
    return bindBlock(draft, target, block, style);
}

}} // namespace QtPptxTemplate::engine
