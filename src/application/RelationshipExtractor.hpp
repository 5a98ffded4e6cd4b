/**
 * @file RelationshipExtractor.hpp
 * @brief Directed similarity edges between members of each leaf cluster.
 */

#pragma once

#include <optional>

#include "domain/ClusterTree.hpp"
#include "domain/MindmapSettings.hpp"
#include "domain/Relationship.hpp"
#include "domain/TextSegment.hpp"

namespace thoughtflow::application {

/**
 * @struct RelationshipSummary
 * @brief Tree-wide statistics over the extracted relationships.
 */
struct RelationshipSummary {
    int totalRelationships = 0;
    int clustersConsidered = 0; ///< Leaves with at least 2 members.
    double averagePerCluster = 0.0;
    double minConfidence = 0.0;
    double maxConfidence = 0.0;
    double meanConfidence = 0.0;
    std::optional<domain::Relationship> strongest;
    std::optional<domain::Relationship> weakest;
};

/**
 * @class RelationshipExtractor
 * @brief Cosine similarity over the original embeddings of each leaf's members.
 *
 * For every member, up to maxRelationshipsPerConcept other members with
 * similarity >= similarityThreshold become edges, strongest first, ties by
 * ascending member index.
 */
class RelationshipExtractor {
public:
    RelationshipExtractor(double similarityThreshold, int maxRelationshipsPerConcept);
    explicit RelationshipExtractor(const domain::MindmapSettings& settings);

    /** @brief Fills relationships and density on every leaf of @p tree. */
    RelationshipSummary extract(domain::ClusterTree& tree, const domain::EmbeddingMatrix& embeddings) const;

    /** @brief Edges among @p members, global indices in and out. */
    std::vector<domain::Relationship> extractForMembers(const std::vector<int>& members,
                                                        const domain::EmbeddingMatrix& embeddings) const;

    static double CosineSimilarity(const domain::EmbeddingVector& a, const domain::EmbeddingVector& b);

private:
    double m_threshold;
    int m_maxPerConcept;
};

} // namespace thoughtflow::application
