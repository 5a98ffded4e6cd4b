/**
 * @file OllamaEmbeddingProvider.cpp
 * @brief Implementation of OllamaEmbeddingProvider.
 */
#include "infrastructure/OllamaEmbeddingProvider.hpp"
#include "infrastructure/ModelSelector.hpp"
#include <iostream>

namespace thoughtflow::infrastructure {

OllamaEmbeddingProvider::OllamaEmbeddingProvider(const OllamaSettings& settings, std::shared_ptr<EmbeddingCache> cache)
    : m_client(settings.host, settings.port, settings.readTimeoutSec),
      m_model(settings.embeddingModel),
      m_cache(std::move(cache)) {
    if (settings.autoSelectModels) {
        auto available = m_client.getAvailableModels();
        if (!available.empty()) {
            m_model = ModelSelector::SelectEmbeddingModel(available, m_model);
        }
    }
    std::cout << "[OllamaEmbeddingProvider] Using embedding model " << m_model << std::endl;
}

std::optional<domain::EmbeddingMatrix> OllamaEmbeddingProvider::encode(const std::vector<std::string>& texts) {
    domain::EmbeddingMatrix result(texts.size());
    std::vector<std::string> missing;
    std::vector<std::size_t> missingPositions;

    for (std::size_t i = 0; i < texts.size(); ++i) {
        if (m_cache) {
            if (auto cached = m_cache->get(m_model, texts[i])) {
                result[i] = std::move(*cached);
                continue;
            }
        }
        missing.push_back(texts[i]);
        missingPositions.push_back(i);
    }

    if (!missing.empty()) {
        auto fresh = m_client.embed(m_model, missing);
        if (!fresh) {
            return std::nullopt;
        }
        for (std::size_t k = 0; k < missing.size(); ++k) {
            if (m_cache) m_cache->update(m_model, missing[k], (*fresh)[k]);
            result[missingPositions[k]] = std::move((*fresh)[k]);
        }
    }
    return result;
}

} // namespace thoughtflow::infrastructure
