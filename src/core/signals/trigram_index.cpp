#include "core/signals/trigram_index.h"

#include <algorithm>
#include <unordered_map>

namespace pm {

namespace {

Trigram pack(QChar a, QChar b, QChar c)
{
    return (static_cast<Trigram>(a.unicode()) << 32)
        | (static_cast<Trigram>(b.unicode()) << 16)
        | static_cast<Trigram>(c.unicode());
}

void addWord(const QString& word, TrigramSet& out)
{
    if (word.isEmpty()) {
        return;
    }
    QString padded;
    padded.reserve(word.size() + 3);
    padded.append(QLatin1String("  "));
    padded.append(word);
    padded.append(QLatin1Char(' '));
    for (int i = 0; i + 2 < padded.size(); ++i) {
        out.push_back(pack(padded.at(i), padded.at(i + 1), padded.at(i + 2)));
    }
}

} // namespace

TrigramSet TrigramIndex::extract(const QString& text)
{
    TrigramSet trigrams;
    const QString lowered = text.toLower();
    trigrams.reserve(static_cast<size_t>(lowered.size()) + 8);

    QString word;
    for (const QChar ch : lowered) {
        if (ch.isLetterOrNumber()) {
            word.append(ch);
        } else if (!word.isEmpty()) {
            addWord(word, trigrams);
            word.clear();
        }
    }
    addWord(word, trigrams);

    std::sort(trigrams.begin(), trigrams.end());
    trigrams.erase(std::unique(trigrams.begin(), trigrams.end()), trigrams.end());
    return trigrams;
}

double TrigramIndex::similarity(const TrigramSet& a, const TrigramSet& b)
{
    if (a.empty() || b.empty()) {
        return 0.0;
    }

    size_t common = 0;
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() && ib != b.end()) {
        if (*ia < *ib) {
            ++ia;
        } else if (*ib < *ia) {
            ++ib;
        } else {
            ++common;
            ++ia;
            ++ib;
        }
    }

    const size_t unionSize = a.size() + b.size() - common;
    return static_cast<double>(common) / static_cast<double>(unionSize);
}

double TrigramIndex::similarity(const QString& a, const QString& b)
{
    return similarity(extract(a), extract(b));
}

void TrigramIndex::build(const std::vector<const TrigramSet*>& documents)
{
    std::unordered_map<Trigram, std::vector<int>> postings;
    for (size_t doc = 0; doc < documents.size(); ++doc) {
        if (!documents[doc]) {
            continue;
        }
        for (const Trigram t : *documents[doc]) {
            postings[t].push_back(static_cast<int>(doc));
        }
    }

    m_postings.clear();
    m_postings.reserve(postings.size());
    for (auto& entry : postings) {
        Posting posting;
        posting.trigram = entry.first;
        posting.documents = std::move(entry.second);
        m_postings.push_back(std::move(posting));
    }
    std::sort(m_postings.begin(), m_postings.end(),
              [](const Posting& lhs, const Posting& rhs) { return lhs.trigram < rhs.trigram; });
    m_documentCount = static_cast<int>(documents.size());
}

std::vector<int> TrigramIndex::lookup(const TrigramSet& query) const
{
    std::vector<int> hits;
    for (const Trigram t : query) {
        auto it = std::lower_bound(m_postings.begin(), m_postings.end(), t,
                                   [](const Posting& posting, Trigram value) {
                                       return posting.trigram < value;
                                   });
        if (it == m_postings.end() || it->trigram != t) {
            continue;
        }
        hits.insert(hits.end(), it->documents.begin(), it->documents.end());
    }
    std::sort(hits.begin(), hits.end());
    hits.erase(std::unique(hits.begin(), hits.end()), hits.end());
    return hits;
}

} // namespace pm
