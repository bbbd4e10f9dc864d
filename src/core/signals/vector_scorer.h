#pragma once

#include "core/signals/embedding_provider.h"

#include <QString>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace pm {

struct EmbeddingCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

class VectorScorer {
public:
    explicit VectorScorer(std::shared_ptr<EmbeddingProvider> provider = nullptr);

    bool hasProvider() const { return m_provider != nullptr; }

    // Query embedding, or nullopt when no provider is configured, the
    // breaker is open, or the provider fails.
    std::optional<std::vector<float>> embedQuery(const QString& text);

    // Cosine similarity clamped to [0, 1]; 0 on size mismatch or zero norm.
    static double cosine(const std::vector<float>& a, const std::vector<float>& b);

    // Expose for testing
    EmbeddingCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

private:
    std::shared_ptr<EmbeddingProvider> m_provider;
    EmbeddingCircuitBreaker m_circuitBreaker;
};

} // namespace pm
