#include "core/signals/vector_scorer.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <utility>

namespace pm {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // anonymous namespace

bool EmbeddingCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    // Open; half-open once the delay has elapsed
    return steadyNowMs() - lastFailureTime.load() < kHalfOpenDelayMs;
}

void EmbeddingCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void EmbeddingCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
}

VectorScorer::VectorScorer(std::shared_ptr<EmbeddingProvider> provider)
    : m_provider(std::move(provider))
{
}

std::optional<std::vector<float>> VectorScorer::embedQuery(const QString& text)
{
    if (!m_provider || text.isEmpty()) {
        return std::nullopt;
    }
    if (m_circuitBreaker.isOpen()) {
        LOG_DEBUG(pmMatch, "Embedding circuit open, vector signal skipped");
        return std::nullopt;
    }

    std::optional<std::vector<float>> embedding;
    try {
        embedding = m_provider->embed(text);
    } catch (const std::exception& e) {
        LOG_WARN(pmMatch, "Embedding provider threw: %s", e.what());
        embedding.reset();
    } catch (...) {
        LOG_WARN(pmMatch, "Embedding provider threw a non-standard exception");
        embedding.reset();
    }

    if (!embedding.has_value() || embedding->empty()) {
        m_circuitBreaker.recordFailure();
        LOG_WARN(pmMatch, "Embedding unavailable (consecutive failures: %d)",
                 m_circuitBreaker.consecutiveFailures.load());
        return std::nullopt;
    }

    m_circuitBreaker.recordSuccess();
    return embedding;
}

double VectorScorer::cosine(const std::vector<float>& a, const std::vector<float>& b)
{
    if (a.empty() || a.size() != b.size()) {
        return 0.0;
    }

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }
    if (normA <= 0.0 || normB <= 0.0) {
        return 0.0;
    }
    const double cos = dot / (std::sqrt(normA) * std::sqrt(normB));
    return std::isfinite(cos) ? std::clamp(cos, 0.0, 1.0) : 0.0;
}

} // namespace pm
