#pragma once

#include <QString>
#include <cstdint>
#include <optional>

namespace pm {

// Human assessment attached to an approved match.
enum class MatchQuality {
    Excellent,
    Good,
    Fair,
    Poor,
};

QString matchQualityToString(MatchQuality quality);
MatchQuality matchQualityFromString(const QString& str);

// Only excellent/good examples feed tiers 1/2 and the learned signal.
bool isHighQuality(MatchQuality quality);

// Scope used when a caller does not name one.
inline QString defaultScope() { return QStringLiteral("default"); }

// Catalog entry. Owned by external catalog management; read-only here.
struct Product {
    QString id;
    QString scope;
    QString sku;
    QString name;
    QString manufacturer;
    QString category;
    QString description;
};

// Per-signal scores, each in [0,1].
struct SignalScores {
    double trigram = 0.0;
    double fuzzy = 0.0;
    double alias = 0.0;
    double learned = 0.0;
    double vector = 0.0;

    void clamp();
};

// Curated or learned mapping from an external name/SKU to a product.
struct Alias {
    int64_t id = 0;
    QString scope;
    QString productId;
    QString competitorName;
    QString competitorSku;
    double confidence = 1.0;
    double createdAt = 0.0;
};

// Human-approved (text -> product) pair.
struct TrainingExample {
    int64_t id = 0;
    QString scope;
    QString queryText;
    QString normalizedText;
    QString productId;
    QString productSku;
    QString productName;
    SignalScores scores;
    double finalScore = 0.0;
    MatchQuality quality = MatchQuality::Good;
    double confidence = 0.8;
    double weight = 1.0;
    int timesReferenced = 0;
    double approvedAt = 0.0;
    std::optional<double> lastReferencedAt;
};

double clampUnit(double value);

} // namespace pm
