/**
 * @file EmbeddingProvider.hpp
 * @brief Interface for the model that maps text to embedding vectors.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/TextSegment.hpp"

namespace thoughtflow::domain {

/**
 * @class EmbeddingProvider
 * @brief Batched text encoder, treated as a pure function by the pipeline.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /**
     * @brief Encodes a batch of texts.
     * @param texts Texts to encode.
     * @return One vector per text, in input order, or nullopt when the provider is unavailable.
     */
    virtual std::optional<EmbeddingMatrix> encode(const std::vector<std::string>& texts) = 0;
};

} // namespace thoughtflow::domain
