#pragma once

namespace pm {

// Tier-3 signal weights. Only the ratios matter: MatchConfig::normalized()
// rescales them so they sum to one.
struct MatchWeights {
    double trigram = 0.40;
    double fuzzy = 0.25;
    double alias = 0.20;
    double learned = 0.10;
    double vector = 0.05;

    double sum() const { return trigram + fuzzy + alias + learned + vector; }
};

struct TierThresholds {
    double exactSimilarity = 0.95;   // tier 1 lower bound
    double goodSimilarity = 0.80;    // tier 2 lower bound
    double goodScoreBase = 0.85;     // tier 2 final score at goodSimilarity
    double goodScoreSpan = 0.10;     // tier 2 final score range
    int trainingRecencyDays = 365;
};

struct SignalConfig {
    double aliasFloor = 0.25;
    double learnedFloor = 0.6;
    double learnedCap = 0.95;
    int learnedRecencyDays = 180;
    int fuzzyCutoff = 8;
};

struct RetrievalConfig {
    int fullScanLimit = 300;
    double retrievalFloor = 0.15;
    double relaxedFloor = 0.1;
    int maxCandidates = 200;
};

struct MatchConfig {
    MatchWeights weights;
    TierThresholds tiers;
    SignalConfig signals;
    RetrievalConfig retrieval;

    // Returns a copy with weights summing to one (defaults when the configured
    // weights are unusable) and every threshold clamped into range.
    MatchConfig normalized() const;
};

} // namespace pm
