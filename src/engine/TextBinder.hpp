/** \file TextBinder.hpp
 *  Fills title/body placeholders (or free text boxes) with strings, runs and bullet lists.
 *  Long text never fails: it is shrunk and then truncated according to the AutoFitPolicy.
 */
#pragma once
#include "engine/AutoFit.hpp"
#include "engine/ShapeXml.hpp"

namespace QtPptxTemplate { namespace engine {

class SlideDraft;

/** Numbered lists for body text, character bullets for columns. */
enum class BulletStyle { Numbered, Character };

class TextBinder {
public:
    TextBinder(int characterBudget, const AutoFitPolicy &policy) : m_budget(characterBudget), m_policy(policy) {}

    FitResult bindText(SlideDraft &draft, const ShapeTarget &target, const QString &text) const;
    FitResult bindBlock(SlideDraft &draft, const ShapeTarget &target, const TextBlock &block,
                        BulletStyle style = BulletStyle::Numbered) const;
    FitResult bindBullets(SlideDraft &draft, const ShapeTarget &target, const std::vector<BulletPoint> &bullets,
                          BulletStyle style) const;

private:
    pugi::xml_node makeShape(SlideDraft &draft, const ShapeTarget &target, const FitResult &fit) const;
    int m_budget;
    AutoFitPolicy m_policy;
};

}} // namespace QtPptxTemplate::engine
