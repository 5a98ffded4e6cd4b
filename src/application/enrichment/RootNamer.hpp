/**
 * @file RootNamer.hpp
 * @brief Title and overview for the whole enriched tree.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "application/generation/GenerationRetrier.hpp"
#include "domain/ClusterTree.hpp"
#include "infrastructure/PromptCatalog.hpp"

namespace thoughtflow::application::enrichment {

struct MindmapTitle {
    std::string title;
    std::string overview;
    bool generated = false; ///< False when the fallback was used.
};

/**
 * @class RootNamer
 * @brief One generation call over the tree outline; never fails.
 */
class RootNamer {
public:
    static constexpr const char* kFallbackTitle = "Untitled Mindmap";

    RootNamer(std::shared_ptr<generation::GenerationRetrier> retrier,
              std::string language,
              std::shared_ptr<const infrastructure::PromptTemplates> prompts = infrastructure::PromptCatalog::Get());

    MindmapTitle name(const domain::ClusterTree& tree);

    /** @brief "  " * depth + "- label: description" per labeled node, pre-order. */
    static std::string BuildOutline(const domain::ClusterTree& tree);

    /**
     * @brief Extracts {title, summary} from raw model output.
     * Reasoning blocks are removed first; when the whole text is not JSON the
     * span from the first '{' to the last '}' is tried.
     */
    static std::optional<MindmapTitle> ParseResponse(const std::string& raw);

private:
    std::shared_ptr<generation::GenerationRetrier> m_retrier;
    std::string m_language;
    std::shared_ptr<const infrastructure::PromptTemplates> m_prompts;
};

} // namespace thoughtflow::application::enrichment
