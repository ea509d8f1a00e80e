/** \file AutoFit.hpp
 *  Deterministic shrink-then-truncate policy for text placeholders.
 */
#pragma once
#include "QtPptxTemplate/RenderConfig.hpp"
#include "QtPptxTemplate/Slide.hpp"

namespace QtPptxTemplate { namespace engine {

struct FitResult {
    int scalePercent{100};  // font scale applied to the placeholder
    int keepCharacters{0};  // characters kept before the marker
    bool truncated{false};
};

/** Capacity at scale s is budget * 100 / s. Shrinks in policy steps until the text fits or the
 *  floor is reached; at the floor the text is cut so that text + marker fits the capacity. */
FitResult fitText(int length, int budget, const AutoFitPolicy &policy);

/** First keepCharacters UTF-16 units of text plus the marker. A cut that would split a
 *  surrogate pair keeps one unit less. */
QString truncateText(const QString &text, int keepCharacters, const QString &marker);

/** Cut a block after keepCharacters characters (runs first, then bullets) and append the marker. */
TextBlock truncateBlock(const TextBlock &block, int keepCharacters, const QString &marker);
std::vector<BulletPoint> truncateBullets(const std::vector<BulletPoint> &bullets, int keepCharacters, const QString &marker);

}} // namespace QtPptxTemplate::engine
