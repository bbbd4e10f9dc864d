#include "core/shared/types.h"

#include <algorithm>
#include <cmath>

namespace pm {

QString matchQualityToString(MatchQuality quality)
{
    switch (quality) {
    case MatchQuality::Excellent: return QStringLiteral("excellent");
    case MatchQuality::Good:      return QStringLiteral("good");
    case MatchQuality::Fair:      return QStringLiteral("fair");
    case MatchQuality::Poor:      return QStringLiteral("poor");
    }
    return QStringLiteral("good");
}

MatchQuality matchQualityFromString(const QString& str)
{
    const QString lowered = str.trimmed().toLower();
    if (lowered == QLatin1String("excellent")) return MatchQuality::Excellent;
    if (lowered == QLatin1String("fair"))      return MatchQuality::Fair;
    if (lowered == QLatin1String("poor"))      return MatchQuality::Poor;
    return MatchQuality::Good;
}

bool isHighQuality(MatchQuality quality)
{
    return quality == MatchQuality::Excellent || quality == MatchQuality::Good;
}

double clampUnit(double value)
{
    if (!std::isfinite(value)) {
        return 0.0;
    }
    return std::clamp(value, 0.0, 1.0);
}

void SignalScores::clamp()
{
    trigram = clampUnit(trigram);
    fuzzy = clampUnit(fuzzy);
    alias = clampUnit(alias);
    learned = clampUnit(learned);
    vector = clampUnit(vector);
}

} // namespace pm
