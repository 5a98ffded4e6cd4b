/**
 * @file MindmapExportService.cpp
 * @brief Implementation of MindmapExportService.
 */

#include "application/MindmapExportService.hpp"

#include "domain/LanguageProfile.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace thoughtflow::application {

using json = nlohmann::json;

namespace {

json RelationshipToJson(const domain::Relationship& r) {
    return {
        {"source", r.sourceIndex},
        {"target", r.targetIndex},
        {"confidence", r.confidence},
        {"type", domain::RelationshipKindToString(r.kind)}
    };
}

// Mermaid breaks on brackets and parentheses inside node text.
std::string MermaidSafe(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' || c == '"') {
            out.push_back(' ');
        } else if (c == '\n' || c == '\r') {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

json MindmapExportService::NodeToJson(const domain::ClusterTree& tree, domain::NodeIndex index) {
    const domain::ClusterNode& node = tree.node(index);

    json j;
    j["id"] = node.id;
    j["label"] = node.label.value_or("");
    if (node.description) {
        j["description"] = *node.description;
    }

    json children = json::array();
    for (domain::NodeIndex child : node.children) {
        children.push_back(NodeToJson(tree, child));
    }
    j["children"] = std::move(children);

    if (!node.relationships.empty()) {
        json rels = json::array();
        for (const auto& r : node.relationships) {
            rels.push_back(RelationshipToJson(r));
        }
        j["relationships"] = std::move(rels);
    }

    j["metadata"] = {
        {"depth", node.depth},
        {"size", node.memberIndices.size()},
        {"member_indices", node.memberIndices},
        {"is_leaf", node.isLeaf()},
        {"leaf_reason", domain::LeafReasonToString(node.leafReason)},
        {"limits", {{"max_depth", node.limits.maxDepth}, {"min_size", node.limits.minSize}}},
        {"relationship_density", node.relationshipDensity}
    };
    return j;
}

json MindmapExportService::ToJson(const MindmapResult& result) {
    json j;
    j["title"] = result.title.title;
    j["overview"] = result.title.overview;
    j["language"] = result.language;
    j["rtl"] = domain::LanguageProfile::FromName(result.language).isRightToLeft();
    j["root"] = result.tree.empty() ? json::object() : NodeToJson(result.tree, result.tree.rootIndex());

    const RelationshipSummary& rs = result.relationships;
    json stats = {
        {"total_relationships", rs.totalRelationships},
        {"clusters_considered", rs.clustersConsidered},
        {"average_per_cluster", rs.averagePerCluster},
        {"min_confidence", rs.minConfidence},
        {"max_confidence", rs.maxConfidence},
        {"mean_confidence", rs.meanConfidence}
    };
    if (rs.strongest) stats["strongest"] = RelationshipToJson(*rs.strongest);
    if (rs.weakest) stats["weakest"] = RelationshipToJson(*rs.weakest);
    j["relationshipStats"] = std::move(stats);

    const enrichment::EnrichmentReport& er = result.enrichment;
    j["enrichment"] = {
        {"nodes", er.nodesVisited},
        {"generated_labels", er.generatedLabels},
        {"fallback_labels", er.fallbackLabels},
        {"generated_descriptions", er.generatedDescriptions},
        {"fallback_descriptions", er.fallbackDescriptions},
        {"sentinel_nodes", er.sentinelNodes},
        {"title_generated", result.title.generated}
    };
    return j;
}

std::string MindmapExportService::ToMermaidMindmap(const MindmapResult& result) {
    std::stringstream ss;
    ss << "```mermaid\n";
    ss << "mindmap\n";
    ss << "  root((" << MermaidSafe(result.title.title) << "))\n";

    if (!result.tree.empty()) {
        for (domain::NodeIndex index : result.tree.preOrder()) {
            const auto& node = result.tree.node(index);
            if (node.depth == 0) continue;
            ss << std::string(static_cast<std::size_t>(node.depth + 1) * 2, ' ')
               << node.id << "[" << MermaidSafe(node.label.value_or(node.id)) << "]\n";
        }
    }

    ss << "```\n";
    return ss.str();
}

bool MindmapExportService::WriteFile(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    if (!out.is_open()) {
        std::cerr << "[MindmapExportService] Cannot write " << path << std::endl;
        return false;
    }
    out << content;
    return true;
}

} // namespace thoughtflow::application
