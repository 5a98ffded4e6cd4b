/**
 * @file NodeEnricher.hpp
 * @brief Assigns a label and a description to every node of a built tree.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "application/generation/GenerationRetrier.hpp"
#include "domain/ClusterTree.hpp"
#include "domain/MindmapSettings.hpp"
#include "domain/TextSegment.hpp"
#include "infrastructure/PromptCatalog.hpp"

namespace thoughtflow::application::enrichment {

/**
 * @struct EnrichmentReport
 * @brief How each label and description was obtained.
 */
struct EnrichmentReport {
    int nodesVisited = 0;
    int generatedLabels = 0;
    int fallbackLabels = 0;
    int generatedDescriptions = 0;
    int fallbackDescriptions = 0;
    int sentinelNodes = 0; ///< Nodes whose enrichment threw.
};

/**
 * @class NodeEnricher
 * @brief Pre-order walk so each node sees its parent's label as context.
 *
 * Every node ends up with a non-empty label: generated, derived from its
 * first member text, or the sentinel when enrichment of that node threw.
 */
class NodeEnricher {
public:
    static constexpr const char* kSentinelLabel = "Untitled Topic";
    static constexpr const char* kSentinelDescription = "No description available.";
    static constexpr const char* kRootContext = "ROOT";

    NodeEnricher(std::shared_ptr<generation::GenerationRetrier> retrier,
                 const domain::MindmapSettings& settings,
                 std::shared_ptr<const infrastructure::PromptTemplates> prompts = infrastructure::PromptCatalog::Get());

    EnrichmentReport enrich(domain::ClusterTree& tree, const std::vector<domain::TextSegment>& segments);

    /**
     * @brief Deterministic label from a member text: at most 50 characters and
     * min(8, maxWords) words, capitalized, "..." when cut, "Untitled" when empty.
     */
    static std::string FallbackLabel(const std::string& firstText, int maxWords);

private:
    void enrichNode(domain::ClusterTree& tree, domain::NodeIndex index,
                    const std::vector<domain::TextSegment>& segments, EnrichmentReport& report);

    std::string sampleText(const domain::ClusterNode& node, const std::vector<domain::TextSegment>& segments,
                           int charBudget) const;

    std::shared_ptr<generation::GenerationRetrier> m_retrier;
    domain::MindmapSettings m_settings;
    std::shared_ptr<const infrastructure::PromptTemplates> m_prompts;
};

} // namespace thoughtflow::application::enrichment
