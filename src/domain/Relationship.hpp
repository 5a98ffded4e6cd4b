/**
 * @file Relationship.hpp
 * @brief Directed semantic link between two segments of the same leaf cluster.
 */

#pragma once

#include <string>

namespace thoughtflow::domain {

enum class RelationshipKind {
    SemanticSimilarity
};

inline std::string RelationshipKindToString(RelationshipKind kind) {
    switch (kind) {
        case RelationshipKind::SemanticSimilarity: return "semantic_similarity";
    }
    return "unknown";
}

/**
 * @struct Relationship
 * @brief A->B with confidence c does not imply B->A with the same c.
 */
struct Relationship {
    int sourceIndex = 0;  ///< Global segment index.
    int targetIndex = 0;  ///< Global segment index.
    float confidence = 0.0f; ///< Cosine similarity clamped to [0, 1].
    RelationshipKind kind = RelationshipKind::SemanticSimilarity;
};

} // namespace thoughtflow::domain
