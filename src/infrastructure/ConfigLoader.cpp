/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>
#include <iterator>

namespace thoughtflow::infrastructure {

using json = nlohmann::json;

namespace {

template <typename T>
void ReadValue(const json& section, const char* key, T& target, std::vector<std::string>& errors) {
    if (!section.contains(key)) return;
    try {
        target = section.at(key).get<T>();
    } catch (const json::exception& e) {
        errors.push_back(std::string(key) + ": " + e.what());
    }
}

void ReadMindmap(const json& j, domain::MindmapSettings& s, std::vector<std::string>& errors) {
    ReadValue(j, "max_depth", s.maxDepth, errors);
    ReadValue(j, "min_size", s.minSize, errors);
    ReadValue(j, "svd_components", s.svdComponents, errors);
    ReadValue(j, "cluster_size_ratio", s.clusterSizeRatio, errors);
    ReadValue(j, "similarity_threshold", s.similarityThreshold, errors);
    ReadValue(j, "max_relationships_per_concept", s.maxRelationshipsPerConcept, errors);
    ReadValue(j, "generation_retries", s.generationRetries, errors);
    ReadValue(j, "inter_call_delay_ms", s.interCallDelayMs, errors);
    ReadValue(j, "language", s.language, errors);
    ReadValue(j, "sample_text_count", s.sampleTextCount, errors);
    ReadValue(j, "label_char_budget", s.labelCharBudget, errors);
    ReadValue(j, "description_char_budget", s.descriptionCharBudget, errors);
    ReadValue(j, "label_max_words", s.labelMaxWords, errors);
    ReadValue(j, "description_max_words", s.descriptionMaxWords, errors);
    ReadValue(j, "embedding_batch_size", s.embeddingBatchSize, errors);
}

void ReadOllama(const json& j, OllamaSettings& s, std::vector<std::string>& errors) {
    ReadValue(j, "host", s.host, errors);
    ReadValue(j, "port", s.port, errors);
    ReadValue(j, "read_timeout_sec", s.readTimeoutSec, errors);
    ReadValue(j, "generation_model", s.generationModel, errors);
    ReadValue(j, "embedding_model", s.embeddingModel, errors);
    ReadValue(j, "auto_select_models", s.autoSelectModels, errors);
    ReadValue(j, "cache_dir", s.cacheDir, errors);
    ReadValue(j, "prompts_file", s.promptsFile, errors);
}

json MindmapToJson(const domain::MindmapSettings& s) {
    return {
        {"max_depth", s.maxDepth},
        {"min_size", s.minSize},
        {"svd_components", s.svdComponents},
        {"cluster_size_ratio", s.clusterSizeRatio},
        {"similarity_threshold", s.similarityThreshold},
        {"max_relationships_per_concept", s.maxRelationshipsPerConcept},
        {"generation_retries", s.generationRetries},
        {"inter_call_delay_ms", s.interCallDelayMs},
        {"language", s.language},
        {"sample_text_count", s.sampleTextCount},
        {"label_char_budget", s.labelCharBudget},
        {"description_char_budget", s.descriptionCharBudget},
        {"label_max_words", s.labelMaxWords},
        {"description_max_words", s.descriptionMaxWords},
        {"embedding_batch_size", s.embeddingBatchSize}
    };
}

json OllamaToJson(const OllamaSettings& s) {
    return {
        {"host", s.host},
        {"port", s.port},
        {"read_timeout_sec", s.readTimeoutSec},
        {"generation_model", s.generationModel},
        {"embedding_model", s.embeddingModel},
        {"auto_select_models", s.autoSelectModels},
        {"cache_dir", s.cacheDir},
        {"prompts_file", s.promptsFile}
    };
}

AppConfig FromJson(const json& j) {
    AppConfig config;
    if (!j.is_object()) {
        config.errors.push_back("settings root must be a JSON object");
        return config;
    }

    domain::MindmapSettings candidate;
    if (j.contains("mindmap") && j["mindmap"].is_object()) {
        ReadMindmap(j["mindmap"], candidate, config.errors);
    }
    if (j.contains("ollama") && j["ollama"].is_object()) {
        ReadOllama(j["ollama"], config.ollama, config.errors);
    }

    // Out-of-range values fall back to their defaults one by one.
    const domain::MindmapSettings defaults;
    auto rangeErrors = ConfigLoader::Validate(candidate);
    config.mindmap = candidate;
    if (!rangeErrors.empty()) {
        domain::MindmapSettings& m = config.mindmap;
        if (m.maxDepth < 1 || m.maxDepth > 10) m.maxDepth = defaults.maxDepth;
        if (m.minSize < 1 || m.minSize > 100) m.minSize = defaults.minSize;
        if (m.svdComponents < 1) m.svdComponents = defaults.svdComponents;
        if (!(m.clusterSizeRatio > 0.0 && m.clusterSizeRatio <= 1.0)) m.clusterSizeRatio = defaults.clusterSizeRatio;
        if (!(m.similarityThreshold >= 0.0 && m.similarityThreshold <= 1.0)) m.similarityThreshold = defaults.similarityThreshold;
        if (m.maxRelationshipsPerConcept < 0) m.maxRelationshipsPerConcept = defaults.maxRelationshipsPerConcept;
        if (m.generationRetries < 0) m.generationRetries = defaults.generationRetries;
        if (m.interCallDelayMs < 0) m.interCallDelayMs = defaults.interCallDelayMs;
        if (m.sampleTextCount < 1) m.sampleTextCount = defaults.sampleTextCount;
        if (m.labelCharBudget < 1) m.labelCharBudget = defaults.labelCharBudget;
        if (m.descriptionCharBudget < 1) m.descriptionCharBudget = defaults.descriptionCharBudget;
        if (m.labelMaxWords < 2) m.labelMaxWords = defaults.labelMaxWords;
        if (m.descriptionMaxWords < 2) m.descriptionMaxWords = defaults.descriptionMaxWords;
        if (m.embeddingBatchSize < 1) m.embeddingBatchSize = defaults.embeddingBatchSize;
        config.errors.insert(config.errors.end(), rangeErrors.begin(), rangeErrors.end());
    }
    return config;
}

} // namespace

std::vector<std::string> ConfigLoader::Validate(const domain::MindmapSettings& s) {
    std::vector<std::string> errors;
    if (s.maxDepth < 1 || s.maxDepth > 10) errors.push_back("max_depth must be between 1 and 10");
    if (s.minSize < 1 || s.minSize > 100) errors.push_back("min_size must be between 1 and 100");
    if (s.svdComponents < 1) errors.push_back("svd_components must be positive");
    if (!(s.clusterSizeRatio > 0.0 && s.clusterSizeRatio <= 1.0)) errors.push_back("cluster_size_ratio must be in (0, 1]");
    if (!(s.similarityThreshold >= 0.0 && s.similarityThreshold <= 1.0)) errors.push_back("similarity_threshold must be in [0, 1]");
    if (s.maxRelationshipsPerConcept < 0) errors.push_back("max_relationships_per_concept must not be negative");
    if (s.generationRetries < 0) errors.push_back("generation_retries must not be negative");
    if (s.interCallDelayMs < 0) errors.push_back("inter_call_delay_ms must not be negative");
    if (s.sampleTextCount < 1) errors.push_back("sample_text_count must be positive");
    if (s.labelCharBudget < 1) errors.push_back("label_char_budget must be positive");
    if (s.descriptionCharBudget < 1) errors.push_back("description_char_budget must be positive");
    if (s.labelMaxWords < 2) errors.push_back("label_max_words must be at least 2");
    if (s.descriptionMaxWords < 2) errors.push_back("description_max_words must be at least 2");
    if (s.embeddingBatchSize < 1) errors.push_back("embedding_batch_size must be positive");
    return errors;
}

AppConfig ConfigLoader::FromJsonString(const std::string& content) {
    try {
        return FromJson(json::parse(content));
    } catch (const json::parse_error& e) {
        AppConfig config;
        config.errors.push_back(std::string("settings are not valid JSON: ") + e.what());
        return config;
    }
}

AppConfig ConfigLoader::Load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        std::cout << "[ConfigLoader] " << path << " not found, using defaults." << std::endl;
        return AppConfig{};
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        AppConfig config;
        config.errors.push_back("cannot open " + path);
        return config;
    }
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    AppConfig config = FromJsonString(content);
    for (const auto& err : config.errors) {
        std::cerr << "[ConfigLoader] " << path << ": " << err << std::endl;
    }
    return config;
}

bool ConfigLoader::Save(const std::string& path, const AppConfig& config) {
    json j = json::object();

    // Preserve keys written by other tools.
    if (std::filesystem::exists(path)) {
        try {
            std::ifstream f(path);
            f >> j;
            if (!j.is_object()) j = json::object();
        } catch (const json::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable " << path << ": " << e.what() << std::endl;
            j = json::object();
        }
    }

    j["mindmap"] = MindmapToJson(config.mindmap);
    j["ollama"] = OllamaToJson(config.ollama);

    std::ofstream f(path);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Error writing " << path << std::endl;
        return false;
    }
    f << j.dump(4);
    return true;
}

} // namespace thoughtflow::infrastructure
