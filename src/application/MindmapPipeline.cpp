/**
 * @file MindmapPipeline.cpp
 * @brief Implementation of MindmapPipeline.
 */

#include "application/MindmapPipeline.hpp"

#include "application/SegmentNormalizer.hpp"
#include "application/clustering/TreeBuilder.hpp"
#include "application/generation/GenerationRetrier.hpp"
#include "domain/LanguageProfile.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>

namespace thoughtflow::application {

using domain::ErrorKind;
using domain::Result;

MindmapPipeline::MindmapPipeline(std::shared_ptr<domain::EmbeddingProvider> embedder,
                                 std::shared_ptr<domain::TextGenerationProvider> generator,
                                 domain::MindmapSettings settings,
                                 std::shared_ptr<generation::CallPacer> pacer,
                                 std::shared_ptr<const infrastructure::PromptTemplates> prompts)
    : m_embedder(std::move(embedder)),
      m_generator(std::move(generator)),
      m_settings(std::move(settings)),
      m_pacer(std::move(pacer)),
      m_prompts(std::move(prompts)) {
    m_settings.language = domain::LanguageProfile::FromName(m_settings.language).name();
    if (!m_prompts) {
        m_prompts = infrastructure::PromptCatalog::Get();
    }
    if (!m_pacer) {
        m_pacer = std::make_shared<generation::CallPacer>(
            std::chrono::milliseconds(std::max(0, m_settings.interCallDelayMs)));
    }
}

std::optional<domain::Error> MindmapPipeline::ValidateInput(const std::vector<domain::TextSegment>& segments,
                                                            const domain::EmbeddingMatrix& embeddings) {
    if (segments.empty()) {
        return domain::Error{ErrorKind::InputError, "document has no usable segments"};
    }
    if (embeddings.size() != segments.size()) {
        return domain::Error{ErrorKind::InputError,
                             "got " + std::to_string(embeddings.size()) + " embeddings for " +
                             std::to_string(segments.size()) + " segments"};
    }
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (segments[i].index != static_cast<int>(i)) {
            return domain::Error{ErrorKind::InputError, "segment indices must be 0..n-1 in order"};
        }
    }
    const std::size_t dims = embeddings.front().size();
    if (dims == 0) {
        return domain::Error{ErrorKind::InputError, "embeddings are empty"};
    }
    for (std::size_t i = 0; i < embeddings.size(); ++i) {
        if (embeddings[i].size() != dims) {
            return domain::Error{ErrorKind::InputError,
                                 "embedding " + std::to_string(i) + " has " + std::to_string(embeddings[i].size()) +
                                 " dimensions, expected " + std::to_string(dims)};
        }
        for (float v : embeddings[i]) {
            if (!std::isfinite(v)) {
                return domain::Error{ErrorKind::InputError,
                                     "embedding " + std::to_string(i) + " contains non-finite values"};
            }
        }
    }
    return std::nullopt;
}

Result<domain::EmbeddingMatrix> MindmapPipeline::embed(const std::vector<domain::TextSegment>& segments) {
    if (!m_embedder) {
        return Result<domain::EmbeddingMatrix>::Fail(ErrorKind::ProviderUnavailable, "no embedding provider");
    }

    const std::size_t batchSize = static_cast<std::size_t>(std::max(1, m_settings.embeddingBatchSize));
    domain::EmbeddingMatrix all;
    all.reserve(segments.size());

    for (std::size_t start = 0; start < segments.size(); start += batchSize) {
        const std::size_t end = std::min(segments.size(), start + batchSize);
        std::vector<std::string> batch;
        batch.reserve(end - start);
        for (std::size_t i = start; i < end; ++i) {
            batch.push_back(segments[i].cleanedText);
        }

        auto vectors = m_embedder->encode(batch);
        if (!vectors) {
            return Result<domain::EmbeddingMatrix>::Fail(ErrorKind::ProviderUnavailable,
                                                         "embedding provider returned nothing for batch at " +
                                                         std::to_string(start));
        }
        if (vectors->size() != batch.size()) {
            return Result<domain::EmbeddingMatrix>::Fail(ErrorKind::InputError,
                                                         "embedding provider returned " +
                                                         std::to_string(vectors->size()) + " vectors for " +
                                                         std::to_string(batch.size()) + " texts");
        }
        for (auto& v : *vectors) {
            all.push_back(std::move(v));
        }
    }
    std::cout << "[MindmapPipeline] Embedded " << all.size() << " segments in batches of " << batchSize << std::endl;
    return std::move(all);
}

Result<MindmapResult> MindmapPipeline::run(const std::vector<std::string>& rawSegments) {
    auto segments = SegmentNormalizer::Normalize(rawSegments);
    std::cout << "[MindmapPipeline] " << segments.size() << " of " << rawSegments.size()
              << " segments kept after normalization" << std::endl;
    if (segments.empty()) {
        return Result<MindmapResult>::Fail(ErrorKind::InputError, "document has no usable segments");
    }

    auto embeddings = embed(segments);
    if (!embeddings) {
        return embeddings.error();
    }
    return run(std::move(segments), embeddings.value());
}

Result<MindmapResult> MindmapPipeline::run(std::vector<domain::TextSegment> segments,
                                           const domain::EmbeddingMatrix& embeddings) {
    if (auto problem = ValidateInput(segments, embeddings)) {
        std::cerr << "[MindmapPipeline] Rejected input: " << problem->message << std::endl;
        return *problem;
    }

    MindmapResult result;
    result.language = m_settings.language;

    clustering::TreeBuilder builder(m_settings);
    result.tree = builder.build(segments, embeddings);

    auto retrier = std::make_shared<generation::GenerationRetrier>(m_generator, m_pacer);
    enrichment::NodeEnricher enricher(retrier, m_settings, m_prompts);
    result.enrichment = enricher.enrich(result.tree, segments);

    RelationshipExtractor extractor(m_settings);
    result.relationships = extractor.extract(result.tree, embeddings);

    enrichment::RootNamer namer(retrier, m_settings.language, m_prompts);
    result.title = namer.name(result.tree);

    if (!result.tree.validate(result.validationErrors, true)) {
        std::cerr << "[MindmapPipeline] STRUCTURAL VALIDATION FAILED (" << result.validationErrors.size()
                  << " violations):" << std::endl;
        for (const auto& err : result.validationErrors) {
            std::cerr << "  - " << err << std::endl;
        }
    }

    result.segments = std::move(segments);
    return std::move(result);
}

} // namespace thoughtflow::application
