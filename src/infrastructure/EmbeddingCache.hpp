/**
 * @file EmbeddingCache.hpp
 * @brief Persistence for segment embeddings.
 */

#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <utility>

namespace thoughtflow::infrastructure {

/**
 * @class EmbeddingCache
 * @brief Local cache of embeddings keyed by model and text content, so re-running a document
 * does not re-encode unchanged segments.
 */
class EmbeddingCache {
public:
    explicit EmbeddingCache(const std::string& cacheDir);

    /** @brief Stores the embedding of @p text produced by @p model. */
    void update(const std::string& model, const std::string& text, const std::vector<float>& embedding);

    /** @brief Retrieves an embedding when this exact text was encoded by this model. */
    std::optional<std::vector<float>> get(const std::string& model, const std::string& text) const;

    std::size_t size() const { return m_entries.size(); }

    /** @brief Saves cache to .embeddings.json in the cache directory. */
    bool persist() const;

    /** @brief Loads cache from disk; a missing or unrecognized file leaves it empty. */
    void load();

private:
    std::string m_cacheDir;
    // (model, exact text) -> embedding
    std::map<std::pair<std::string, std::string>, std::vector<float>> m_entries;
};

} // namespace thoughtflow::infrastructure
