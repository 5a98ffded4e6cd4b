/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Keeps JSON parsing out of the pipeline: the core only ever sees
 * domain::MindmapSettings.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/MindmapSettings.hpp"

namespace thoughtflow::infrastructure {

/**
 * @struct OllamaSettings
 * @brief Connection and model settings for the Ollama backend.
 */
struct OllamaSettings {
    std::string host = "localhost";
    int port = 11434;
    int readTimeoutSec = 600;
    std::string generationModel = "qwen2.5:7b";
    std::string embeddingModel = "nomic-embed-text";
    bool autoSelectModels = true;
    std::string cacheDir = ".thoughtflow";
    std::string promptsFile; ///< Optional prompts.json with template overrides.
};

/**
 * @struct AppConfig
 * @brief Everything read from settings.json.
 */
struct AppConfig {
    domain::MindmapSettings mindmap;
    OllamaSettings ollama;
    std::vector<std::string> errors; ///< One message per rejected value; defaults are kept for those.
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json. Missing keys keep their defaults, unknown keys are ignored.
     * @param path Path to the settings file; a missing file yields the defaults.
     */
    static AppConfig Load(const std::string& path);

    /** @brief Parses settings from an already loaded JSON document string. */
    static AppConfig FromJsonString(const std::string& content);

    /**
     * @brief Checks the value ranges of @p settings.
     * @return One message per out-of-range value.
     */
    static std::vector<std::string> Validate(const domain::MindmapSettings& settings);

    /** @brief Writes @p config to @p path, preserving keys this loader does not know. */
    static bool Save(const std::string& path, const AppConfig& config);
};

} // namespace thoughtflow::infrastructure
