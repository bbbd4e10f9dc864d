#pragma once

#include <QString>

#include <cstdint>
#include <vector>

namespace pm {

// A trigram packs three UTF-16 code units into the low 48 bits.
using Trigram = uint64_t;

// Sorted, de-duplicated trigrams of a string.
using TrigramSet = std::vector<Trigram>;

// Trigram similarity with pg_trgm semantics, plus an inverted index from
// trigram to document ordinal used to avoid scanning every document.
class TrigramIndex {
public:
    // Words are maximal letter/digit runs, lowercased, each padded with two
    // leading blanks and one trailing blank before shingling.
    static TrigramSet extract(const QString& text);

    // |A n B| / |A u B|; 0 when either side is empty.
    static double similarity(const TrigramSet& a, const TrigramSet& b);
    static double similarity(const QString& a, const QString& b);

    TrigramIndex() = default;

    // Document ordinals are the positions in `documents`.
    void build(const std::vector<const TrigramSet*>& documents);

    // Ordinals of documents sharing at least one trigram with `query`,
    // ascending and unique.
    std::vector<int> lookup(const TrigramSet& query) const;

    int documentCount() const { return m_documentCount; }

private:
    struct Posting {
        Trigram trigram = 0;
        std::vector<int> documents;
    };

    // Sorted by trigram for binary search.
    std::vector<Posting> m_postings;
    int m_documentCount = 0;
};

} // namespace pm
