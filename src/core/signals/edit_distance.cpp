#include "core/signals/edit_distance.h"

#include <QStringList>

#include <algorithm>
#include <cstdlib>
#include <vector>

namespace pm {

int EditDistance::levenshtein(const QString& a, const QString& b)
{
    const int m = a.length();
    const int n = b.length();
    if (m == 0) {
        return n;
    }
    if (n == 0) {
        return m;
    }

    // Two-row DP
    std::vector<int> prev(n + 1);
    std::vector<int> curr(n + 1);
    for (int j = 0; j <= n; ++j) {
        prev[j] = j;
    }

    for (int i = 1; i <= m; ++i) {
        curr[0] = i;
        for (int j = 1; j <= n; ++j) {
            if (a.at(i - 1) == b.at(j - 1)) {
                curr[j] = prev[j - 1];
            } else {
                curr[j] = 1 + std::min({prev[j],       // deletion
                                         curr[j - 1],   // insertion
                                         prev[j - 1]}); // substitution
            }
        }
        std::swap(prev, curr);
    }

    return prev[n];
}

double EditDistance::fuzzyScore(const QString& a, const QString& b, int cutoff)
{
    if (a.isEmpty() || b.isEmpty()) {
        return 0.0;
    }
    if (a == b) {
        return 1.0;
    }
    // Length difference alone already exceeds the cutoff.
    if (std::abs(a.length() - b.length()) > cutoff) {
        return 0.0;
    }

    const int distance = levenshtein(a, b);
    if (distance > cutoff) {
        return 0.0;
    }
    const int maxLen = static_cast<int>(std::max(a.length(), b.length()));
    return std::clamp(1.0 - static_cast<double>(distance) / maxLen, 0.0, 1.0);
}

double EditDistance::compositeScore(const QString& a, const QString& b)
{
    if (a.trimmed().isEmpty() || b.trimmed().isEmpty()) {
        return 0.0;
    }
    if (a == b) {
        return 1.0;
    }

    const int maxLen = static_cast<int>(std::max(a.length(), b.length()));
    const double editScore =
        std::clamp(1.0 - static_cast<double>(levenshtein(a, b)) / maxLen, 0.0, 1.0);

    const double score = editScore * 0.5 + wordOverlap(a, b) * 0.3 + substringRatio(a, b) * 0.2;
    return std::clamp(score, 0.0, 1.0);
}

double EditDistance::wordOverlap(const QString& a, const QString& b)
{
    const QStringList wordsA = a.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    const QStringList wordsB = b.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    const int total = static_cast<int>(std::max(wordsA.size(), wordsB.size()));
    if (total == 0) {
        return 1.0;
    }

    int common = 0;
    for (const QString& word : wordsA) {
        if (wordsB.contains(word)) {
            ++common;
        }
    }
    return static_cast<double>(common) / total;
}

double EditDistance::substringRatio(const QString& a, const QString& b)
{
    const QString& longer = a.length() >= b.length() ? a : b;
    const QString& shorter = a.length() >= b.length() ? b : a;

    if (longer.contains(shorter)) {
        return static_cast<double>(shorter.length()) / longer.length();
    }

    // Longest shared run of 3..10 characters.
    constexpr int kMinRun = 3;
    constexpr int kMaxRun = 10;
    for (int len = std::min<int>(shorter.length(), kMaxRun); len >= kMinRun; --len) {
        for (int start = 0; start + len <= shorter.length(); ++start) {
            if (longer.contains(shorter.mid(start, len))) {
                return static_cast<double>(len) / longer.length();
            }
        }
    }
    return 0.0;
}

} // namespace pm
