/**
 * @file MindmapSettings.hpp
 * @brief Tunables consumed by the clustering and enrichment pipeline.
 */

#pragma once

#include <string>

namespace thoughtflow::domain {

/**
 * @struct MindmapSettings
 * @brief Supplied by the configuration layer; the pipeline never loads it itself.
 */
struct MindmapSettings {
    // Tree construction
    int maxDepth = 3;
    int minSize = 2;
    int svdComponents = 50;
    double clusterSizeRatio = 0.15;

    // Relationships
    double similarityThreshold = 0.7;
    int maxRelationshipsPerConcept = 5;

    // Generation
    int generationRetries = 2;
    int interCallDelayMs = 1000;
    std::string language = "English";
    int sampleTextCount = 10;
    int labelCharBudget = 1500;
    int descriptionCharBudget = 3000;
    int labelMaxWords = 10;
    int descriptionMaxWords = 60;

    // Embedding
    int embeddingBatchSize = 16;
};

} // namespace thoughtflow::domain
