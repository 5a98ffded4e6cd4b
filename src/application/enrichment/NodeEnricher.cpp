/**
 * @file NodeEnricher.cpp
 * @brief Implementation of NodeEnricher.
 */

#include "application/enrichment/NodeEnricher.hpp"

#include "domain/LanguageProfile.hpp"
#include "domain/TextUtils.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace thoughtflow::application::enrichment {

namespace text = domain::text;

namespace {

constexpr std::size_t kFallbackLabelChars = 50;
constexpr int kFallbackLabelWords = 8;

} // namespace

NodeEnricher::NodeEnricher(std::shared_ptr<generation::GenerationRetrier> retrier,
                           const domain::MindmapSettings& settings,
                           std::shared_ptr<const infrastructure::PromptTemplates> prompts)
    : m_retrier(std::move(retrier)), m_settings(settings), m_prompts(std::move(prompts)) {
    if (!m_prompts) {
        m_prompts = infrastructure::PromptCatalog::Get();
    }
}

std::string NodeEnricher::FallbackLabel(const std::string& firstText, int maxWords) {
    const std::string collapsed = text::CollapseWhitespace(firstText);
    if (collapsed.empty()) return "Untitled";

    std::string cut = text::TruncateCodePoints(collapsed, kFallbackLabelChars);
    bool truncated = cut.size() < collapsed.size();

    const auto words = text::SplitWords(cut);
    const std::size_t wordLimit = static_cast<std::size_t>(std::max(1, std::min(kFallbackLabelWords, maxWords)));
    if (words.size() > wordLimit) truncated = true;

    std::string label = text::CapitalizeFirst(text::JoinWords(words, wordLimit));
    if (label.empty()) return "Untitled";
    if (truncated) label += "...";
    return label;
}

std::string NodeEnricher::sampleText(const domain::ClusterNode& node,
                                     const std::vector<domain::TextSegment>& segments,
                                     int charBudget) const {
    std::string joined;
    const std::size_t limit = static_cast<std::size_t>(std::max(1, m_settings.sampleTextCount));
    for (std::size_t i = 0; i < node.memberIndices.size() && i < limit; ++i) {
        const auto& segment = segments.at(static_cast<std::size_t>(node.memberIndices[i]));
        if (!joined.empty()) joined.push_back('\n');
        joined += segment.cleanedText;
    }
    return text::TruncateCodePoints(joined, static_cast<std::size_t>(std::max(0, charBudget)));
}

EnrichmentReport NodeEnricher::enrich(domain::ClusterTree& tree, const std::vector<domain::TextSegment>& segments) {
    EnrichmentReport report;
    const auto order = tree.preOrder();
    std::cout << "[NodeEnricher] Enriching " << order.size() << " nodes in " << m_settings.language << std::endl;

    for (domain::NodeIndex index : order) {
        ++report.nodesVisited;
        try {
            enrichNode(tree, index, segments, report);
        } catch (const std::exception& e) {
            domain::ClusterNode& node = tree.node(index);
            std::cerr << "[NodeEnricher] " << node.id << " failed, using sentinel: " << e.what() << std::endl;
            node.label = kSentinelLabel;
            node.description = kSentinelDescription;
            ++report.sentinelNodes;
        }
    }

    std::cout << "[NodeEnricher] Done. Labels: " << report.generatedLabels << " generated, "
              << report.fallbackLabels << " fallback; descriptions: " << report.generatedDescriptions
              << " generated, " << report.fallbackDescriptions << " fallback; "
              << report.sentinelNodes << " sentinel." << std::endl;
    return report;
}

void NodeEnricher::enrichNode(domain::ClusterTree& tree, domain::NodeIndex index,
                              const std::vector<domain::TextSegment>& segments, EnrichmentReport& report) {
    const domain::ClusterNode& node = tree.node(index);

    std::string parentLabel = kRootContext;
    if (node.parent) {
        const auto& parent = tree.node(*node.parent);
        if (parent.label && !parent.label->empty()) parentLabel = *parent.label;
    }

    const std::string firstText = node.memberIndices.empty()
        ? std::string()
        : segments.at(static_cast<std::size_t>(node.memberIndices.front())).cleanedText;

    // Label
    const std::string labelPrompt = infrastructure::PromptCatalog::Format(m_prompts->label, {
        {"language", m_settings.language},
        {"parent_label", parentLabel},
        {"depth", std::to_string(node.depth)},
        {"max_words", std::to_string(m_settings.labelMaxWords)},
        {"texts", sampleText(node, segments, m_settings.labelCharBudget)}
    });

    std::string label;
    auto generatedLabel = m_retrier->generateValidated(labelPrompt, m_settings.language,
                                                       m_settings.generationRetries, m_settings.labelMaxWords);
    if (generatedLabel) {
        label = generatedLabel.value();
        ++report.generatedLabels;
    } else {
        label = FallbackLabel(firstText, m_settings.labelMaxWords);
        ++report.fallbackLabels;
        std::cerr << "[NodeEnricher] " << node.id << ": label fallback (" << generatedLabel.error().message
                  << ")" << std::endl;
    }

    // Description
    const std::string descriptionPrompt = infrastructure::PromptCatalog::Format(m_prompts->description, {
        {"language", m_settings.language},
        {"label", label},
        {"parent_label", parentLabel},
        {"max_words", std::to_string(m_settings.descriptionMaxWords)},
        {"texts", sampleText(node, segments, m_settings.descriptionCharBudget)}
    });

    std::string description;
    auto generatedDescription = m_retrier->generateValidated(descriptionPrompt, m_settings.language,
                                                             m_settings.generationRetries,
                                                             m_settings.descriptionMaxWords);
    if (generatedDescription) {
        description = generatedDescription.value();
        ++report.generatedDescriptions;
    } else {
        description = domain::LanguageProfile::FromName(m_settings.language).fallbackDescription(label);
        ++report.fallbackDescriptions;
    }

    domain::ClusterNode& target = tree.node(index);
    target.label = label;
    target.description = description;
}

} // namespace thoughtflow::application::enrichment
