/**
 * @file MindmapPipeline.hpp
 * @brief Segments in, enriched and named mindmap tree out.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/RelationshipExtractor.hpp"
#include "application/enrichment/NodeEnricher.hpp"
#include "application/enrichment/RootNamer.hpp"
#include "application/generation/CallPacer.hpp"
#include "domain/ClusterTree.hpp"
#include "domain/EmbeddingProvider.hpp"
#include "domain/MindmapSettings.hpp"
#include "domain/Result.hpp"
#include "domain/TextGenerationProvider.hpp"
#include "domain/TextSegment.hpp"

namespace thoughtflow::application {

/**
 * @struct MindmapResult
 * @brief Everything the presentation layer needs from one invocation.
 */
struct MindmapResult {
    domain::ClusterTree tree;
    std::vector<domain::TextSegment> segments;
    enrichment::MindmapTitle title;
    enrichment::EnrichmentReport enrichment;
    RelationshipSummary relationships;
    std::string language;                   ///< Canonical language name.
    std::vector<std::string> validationErrors; ///< Empty for a well-formed tree.
};

/**
 * @class MindmapPipeline
 * @brief Build, enrich, relate, name. Fails only on InputError or ProviderUnavailable.
 */
class MindmapPipeline {
public:
    MindmapPipeline(std::shared_ptr<domain::EmbeddingProvider> embedder,
                    std::shared_ptr<domain::TextGenerationProvider> generator,
                    domain::MindmapSettings settings,
                    std::shared_ptr<generation::CallPacer> pacer = nullptr,
                    std::shared_ptr<const infrastructure::PromptTemplates> prompts = infrastructure::PromptCatalog::Get());

    /** @brief Normalizes raw lines, embeds them in batches, then runs the pipeline. */
    domain::Result<MindmapResult> run(const std::vector<std::string>& rawSegments);

    /** @brief Runs on segments that already have embeddings (row i belongs to segment i). */
    domain::Result<MindmapResult> run(std::vector<domain::TextSegment> segments,
                                      const domain::EmbeddingMatrix& embeddings);

    /** @brief Encodes segments in fixed-size sequential batches. */
    domain::Result<domain::EmbeddingMatrix> embed(const std::vector<domain::TextSegment>& segments);

    /** @brief Returns the InputError describing why the input is unusable, if any. */
    static std::optional<domain::Error> ValidateInput(const std::vector<domain::TextSegment>& segments,
                                                      const domain::EmbeddingMatrix& embeddings);

    const domain::MindmapSettings& settings() const { return m_settings; }

private:
    std::shared_ptr<domain::EmbeddingProvider> m_embedder;
    std::shared_ptr<domain::TextGenerationProvider> m_generator;
    domain::MindmapSettings m_settings;
    std::shared_ptr<generation::CallPacer> m_pacer;
    std::shared_ptr<const infrastructure::PromptTemplates> m_prompts;
};

} // namespace thoughtflow::application
