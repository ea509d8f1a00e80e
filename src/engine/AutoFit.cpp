#include "engine/AutoFit.hpp"
#include <algorithm>

namespace QtPptxTemplate { namespace engine {

FitResult fitText(int length, int budget, const AutoFitPolicy &policy) {
    FitResult r;
    r.keepCharacters = length;
    if(budget <= 0 || length <= budget) return r;
    const int step = std::max(1, policy.stepPercent);
    const int floor = std::clamp(policy.floorPercent, 1, 100);
    auto capacity = [budget](int scale){ return static_cast<int>(static_cast<qint64>(budget) * 100 / scale); };
    int scale = 100;
    while(scale > floor && length > capacity(scale)) scale = std::max(floor, scale - step);
    r.scalePercent = scale;
    if(length > capacity(scale)) {
        r.truncated = true;
        r.keepCharacters = std::max(0, capacity(scale) - static_cast<int>(policy.truncationMarker.size()));
    }
    return r;
}

QString truncateText(const QString &text, int keepCharacters, const QString &marker) {
    qsizetype keep = std::clamp<qsizetype>(keepCharacters, 0, text.size());
    if(keep > 0 && keep < text.size() && text.at(keep - 1).isHighSurrogate()) --keep;
    return text.left(keep) + marker;
}

namespace {
/** Cut text at remaining; returns true when the cut happened inside this text. */
bool cut(QString &text, int &remaining, const QString &marker) {
    if(text.size() <= remaining) { remaining -= text.size(); return false; }
    text = truncateText(text, remaining, marker);
    remaining = 0;
    return true;
}
} // namespace

TextBlock truncateBlock(const TextBlock &block, int keepCharacters, const QString &marker) {
    TextBlock out;
    int remaining = keepCharacters;
    for(const auto &run : block.runs) {
        TextRun r = run;
        if(cut(r.text, remaining, marker)) { out.runs.push_back(r); return out; }
        out.runs.push_back(r);
    }
    out.bullets = truncateBullets(block.bullets, remaining, marker);
    return out;
}

std::vector<BulletPoint> truncateBullets(const std::vector<BulletPoint> &bullets, int keepCharacters, const QString &marker) {
    std::vector<BulletPoint> out;
    int remaining = keepCharacters;
    for(const auto &bp : bullets) {
        BulletPoint b = bp;
        const bool stop = cut(b.text, remaining, marker);
        out.push_back(b);
        if(stop) break;
    }
    return out;
}

}} // namespace QtPptxTemplate::engine
