/**
 * @file OllamaEmbeddingProvider.hpp
 * @brief EmbeddingProvider backed by a local Ollama server, with an on-disk cache.
 */

#pragma once
#include "domain/EmbeddingProvider.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/EmbeddingCache.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <memory>
#include <string>

namespace thoughtflow::infrastructure {

/**
 * @class OllamaEmbeddingProvider
 * @brief Encodes only the texts missing from the cache, in one /api/embed call per batch.
 */
class OllamaEmbeddingProvider : public domain::EmbeddingProvider {
public:
    OllamaEmbeddingProvider(const OllamaSettings& settings, std::shared_ptr<EmbeddingCache> cache = nullptr);

    std::optional<domain::EmbeddingMatrix> encode(const std::vector<std::string>& texts) override;

    const std::string& model() const { return m_model; }

private:
    OllamaClient m_client;
    std::string m_model;
    std::shared_ptr<EmbeddingCache> m_cache;
};

} // namespace thoughtflow::infrastructure
