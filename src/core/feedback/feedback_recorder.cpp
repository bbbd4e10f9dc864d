#include "core/feedback/feedback_recorder.h"
#include "core/index/catalog_store.h"
#include "core/match/match_engine.h"
#include "core/shared/logging.h"
#include "core/text/text_normalizer.h"

#include <QDateTime>
#include <QHash>
#include <QThread>

#include <algorithm>

namespace pm {

FeedbackRecorder::FeedbackRecorder(CatalogStore* store, MatchEngine* engine)
    : m_store(store)
    , m_engine(engine)
{
}

double FeedbackRecorder::now() const
{
    if (m_clock) {
        return m_clock();
    }
    if (m_engine) {
        return m_engine->now();
    }
    return static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0;
}

std::mutex& FeedbackRecorder::stripeFor(const QString& scope, const QString& normalized,
                                        const QString& productId)
{
    size_t seed = qHash(scope);
    seed = qHash(normalized, seed);
    seed = qHash(productId, seed);
    return m_stripes[seed % kStripeCount];
}

bool FeedbackRecorder::qualifiesForAlias(const Approval& approval)
{
    return isHighQuality(approval.quality)
        && approval.lineItemText.trimmed().length() >= kMinAliasLength;
}

std::optional<TrainingExample> FeedbackRecorder::recordApproval(const Approval& approval, bool publish)
{
    if (!m_store) {
        return std::nullopt;
    }

    const QString scope = approval.scope.trimmed().isEmpty() ? defaultScope()
                                                             : approval.scope.trimmed();
    const QString literal = approval.lineItemText.trimmed();
    const QString normalized = TextNormalizer::normalize(literal);
    if (normalized.isEmpty() || approval.productId.isEmpty()) {
        LOG_WARN(pmFeedback, "Approval ignored: empty line item or product id");
        return std::nullopt;
    }

    const std::optional<Product> product = m_store->getProduct(scope, approval.productId);
    if (!product.has_value()) {
        LOG_WARN(pmFeedback, "Approval ignored: unknown product %s in scope %s",
                 qUtf8Printable(approval.productId), qUtf8Printable(scope));
        return std::nullopt;
    }

    TrainingExample example;
    example.scope = scope;
    example.queryText = literal;
    example.normalizedText = normalized;
    example.productId = product->id;
    example.productSku = product->sku;
    example.productName = product->name;
    if (approval.scores.has_value()) {
        example.scores = *approval.scores;
        example.scores.clamp();
    }
    example.finalScore = clampUnit(approval.finalScore.value_or(0.0));
    example.quality = approval.quality;
    example.confidence = clampUnit(approval.confidence);
    example.approvedAt = now();

    std::lock_guard<std::mutex> pairLock(stripeFor(scope, normalized, product->id));

    std::optional<TrainingExample> stored;
    for (int attempt = 1; attempt <= kMaxAttempts; ++attempt) {
        stored = m_store->upsertTrainingExample(example);
        if (stored.has_value()) {
            break;
        }
        LOG_WARN(pmFeedback, "Training example write failed (attempt %d/%d)",
                 attempt, kMaxAttempts);
        if (attempt < kMaxAttempts) {
            QThread::msleep(50 * attempt);  // 50, 100 ms
        }
    }
    if (!stored.has_value()) {
        LOG_ERROR(pmFeedback, "Approval for product %s not persisted after %d attempts",
                  qUtf8Printable(product->id), kMaxAttempts);
        return std::nullopt;
    }

    LOG_INFO(pmFeedback, "Recorded approval #%lld: '%s' -> %s (%s)",
             static_cast<long long>(stored->id), qUtf8Printable(normalized),
             qUtf8Printable(product->sku), qUtf8Printable(matchQualityToString(stored->quality)));

    std::optional<Alias> alias;
    if (qualifiesForAlias(approval)) {
        Alias candidate;
        candidate.scope = scope;
        candidate.productId = product->id;
        candidate.competitorName = literal;
        candidate.confidence = approval.finalScore.has_value() && *approval.finalScore > 0.0
            ? std::min(*approval.finalScore, 1.0)
            : example.confidence;
        candidate.createdAt = example.approvedAt;
        alias = m_store->upsertAlias(candidate);
        if (!alias.has_value()) {
            LOG_WARN(pmFeedback, "Alias upsert failed for approval #%lld",
                     static_cast<long long>(stored->id));
        }
    }

    if (m_engine && publish) {
        m_engine->applyTrainingExample(*stored);
        if (alias.has_value()) {
            m_engine->applyAlias(*alias);
        }
    }
    return stored;
}

bool FeedbackRecorder::touchReference(int64_t exampleId)
{
    if (!m_store) {
        return false;
    }
    if (!m_store->touchTrainingExample(exampleId, now())) {
        LOG_WARN(pmFeedback, "Could not update reference count for example #%lld",
                 static_cast<long long>(exampleId));
        return false;
    }
    return true;
}

} // namespace pm
