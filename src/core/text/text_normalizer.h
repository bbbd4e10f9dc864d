#pragma once

#include <QString>

namespace pm {

// Numeric dimension tokens found in normalized text, e.g. "5/16-18" and "x2-1".
struct DimensionTokens {
    QString thread;
    QString length;

    bool isEmpty() const { return thread.isEmpty() && length.isEmpty(); }
};

class TextNormalizer {
public:
    // Canonical form used for every comparison and for persisted training
    // text: lowercase, single-spaced, trimmed, abbreviations expanded.
    static QString normalize(const QString& raw);

    // Expects already-normalized text.
    static DimensionTokens dimensionTokens(const QString& normalized);
};

} // namespace pm
