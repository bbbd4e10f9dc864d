#pragma once

#include <QString>

#include <optional>
#include <vector>

namespace pm {

// External source of fixed-length text embeddings. Implementations must be
// safe to call from several batch workers at once. Returning nullopt or
// throwing anything counts as a failure.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual std::optional<std::vector<float>> embed(const QString& text) = 0;
};

} // namespace pm
