/**
 * @file TextSegment.hpp
 * @brief Input units of the pipeline and their embedding vectors.
 */

#pragma once

#include <string>
#include <vector>

namespace thoughtflow::domain {

/**
 * @struct TextSegment
 * @brief One sentence or paragraph of the source document.
 */
struct TextSegment {
    int index = 0;           ///< Position in the document, also the embedding row.
    std::string rawText;     ///< Text as received from ingestion.
    std::string cleanedText; ///< Whitespace-normalized text used for prompts.
};

using EmbeddingVector = std::vector<float>;
using EmbeddingMatrix = std::vector<EmbeddingVector>;

} // namespace thoughtflow::domain
