#pragma once

#include <QString>

namespace pm {

class EditDistance {
public:
    static constexpr int kDefaultCutoff = 8;

    // Plain Levenshtein distance over UTF-16 code units.
    static int levenshtein(const QString& a, const QString& b);

    // 1 - d / max(len); 1 on equality, 0 when either side is empty or the
    // distance exceeds `cutoff`. Inputs are expected to be normalized.
    static double fuzzyScore(const QString& a, const QString& b, int cutoff = kDefaultCutoff);

    // 0.5 * edit similarity + 0.3 * word overlap + 0.2 * common substring ratio.
    static double compositeScore(const QString& a, const QString& b);

private:
    static double wordOverlap(const QString& a, const QString& b);
    static double substringRatio(const QString& a, const QString& b);
};

} // namespace pm
