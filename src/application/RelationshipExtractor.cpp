/**
 * @file RelationshipExtractor.cpp
 * @brief Implementation of RelationshipExtractor.
 */

#include "application/RelationshipExtractor.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace thoughtflow::application {

using domain::Relationship;
using domain::RelationshipKind;

RelationshipExtractor::RelationshipExtractor(double similarityThreshold, int maxRelationshipsPerConcept)
    : m_threshold(similarityThreshold), m_maxPerConcept(maxRelationshipsPerConcept) {}

RelationshipExtractor::RelationshipExtractor(const domain::MindmapSettings& settings)
    : RelationshipExtractor(settings.similarityThreshold, settings.maxRelationshipsPerConcept) {}

double RelationshipExtractor::CosineSimilarity(const domain::EmbeddingVector& a, const domain::EmbeddingVector& b) {
    if (a.size() != b.size() || a.empty()) return 0.0;
    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }
    if (normA <= 0.0 || normB <= 0.0) return 0.0;
    return dot / (std::sqrt(normA) * std::sqrt(normB));
}

std::vector<Relationship> RelationshipExtractor::extractForMembers(const std::vector<int>& members,
                                                                   const domain::EmbeddingMatrix& embeddings) const {
    std::vector<Relationship> edges;
    const std::size_t m = members.size();
    if (m < 2 || m_maxPerConcept <= 0) return edges;

    std::vector<std::vector<double>> sim(m, std::vector<double>(m, 0.0));
    for (std::size_t i = 0; i < m; ++i) {
        for (std::size_t j = i + 1; j < m; ++j) {
            const double s = CosineSimilarity(embeddings.at(static_cast<std::size_t>(members[i])),
                                              embeddings.at(static_cast<std::size_t>(members[j])));
            sim[i][j] = s;
            sim[j][i] = s;
        }
    }

    for (std::size_t i = 0; i < m; ++i) {
        std::vector<std::pair<double, std::size_t>> candidates;
        for (std::size_t j = 0; j < m; ++j) {
            if (j == i || !std::isfinite(sim[i][j])) continue;
            if (sim[i][j] >= m_threshold) candidates.emplace_back(sim[i][j], j);
        }
        std::stable_sort(candidates.begin(), candidates.end(),
                         [](const auto& a, const auto& b) { return a.first > b.first; });

        const std::size_t take = std::min(candidates.size(), static_cast<std::size_t>(m_maxPerConcept));
        for (std::size_t c = 0; c < take; ++c) {
            Relationship r;
            r.sourceIndex = members[i];
            r.targetIndex = members[candidates[c].second];
            r.confidence = static_cast<float>(std::clamp(candidates[c].first, 0.0, 1.0));
            r.kind = RelationshipKind::SemanticSimilarity;
            edges.push_back(r);
        }
    }
    return edges;
}

RelationshipSummary RelationshipExtractor::extract(domain::ClusterTree& tree,
                                                   const domain::EmbeddingMatrix& embeddings) const {
    RelationshipSummary summary;
    double confidenceSum = 0.0;

    for (domain::NodeIndex index : tree.leaves()) {
        domain::ClusterNode& leaf = tree.node(index);
        const std::size_t m = leaf.memberIndices.size();
        if (m < 2) {
            leaf.relationships.clear();
            leaf.relationshipDensity = 0.0;
            continue;
        }

        leaf.relationships = extractForMembers(leaf.memberIndices, embeddings);
        leaf.relationshipDensity = static_cast<double>(leaf.relationships.size()) /
                                   static_cast<double>(m * (m - 1));
        ++summary.clustersConsidered;

        for (const auto& r : leaf.relationships) {
            if (!summary.strongest || r.confidence > summary.strongest->confidence) summary.strongest = r;
            if (!summary.weakest || r.confidence < summary.weakest->confidence) summary.weakest = r;
            confidenceSum += r.confidence;
            ++summary.totalRelationships;
        }
    }

    if (summary.clustersConsidered > 0) {
        summary.averagePerCluster = static_cast<double>(summary.totalRelationships) / summary.clustersConsidered;
    }
    if (summary.totalRelationships > 0) {
        summary.minConfidence = summary.weakest->confidence;
        summary.maxConfidence = summary.strongest->confidence;
        summary.meanConfidence = confidenceSum / summary.totalRelationships;
    }

    std::cout << "[RelationshipExtractor] " << summary.totalRelationships << " relationships across "
              << summary.clustersConsidered << " clusters" << std::endl;
    return summary;
}

} // namespace thoughtflow::application
