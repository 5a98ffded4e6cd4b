/**
 * @file MindmapExportService.hpp
 * @brief Converts a finished mindmap into its presentation formats.
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "application/MindmapPipeline.hpp"

namespace thoughtflow::application {

class MindmapExportService {
public:
    /**
     * @brief Presentation JSON: {title, overview, language, rtl, root, relationshipStats, enrichment}.
     * Each node is {id, label, description?, children, relationships?, metadata}.
     */
    static nlohmann::json ToJson(const MindmapResult& result);

    static nlohmann::json NodeToJson(const domain::ClusterTree& tree, domain::NodeIndex index);

    /** @brief Exports the tree as a Mermaid mindmap block. */
    static std::string ToMermaidMindmap(const MindmapResult& result);

    /** @brief Writes @p content to @p path; false when the file cannot be opened. */
    static bool WriteFile(const std::string& path, const std::string& content);
};

} // namespace thoughtflow::application
