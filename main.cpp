/**
 * @file main.cpp
 * @brief Command-line entry point: text file in, mindmap JSON or Mermaid out.
 */

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "application/MindmapExportService.hpp"
#include "application/MindmapPipeline.hpp"
#include "application/SegmentNormalizer.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ConsoleRedirect.hpp"
#include "infrastructure/EmbeddingCache.hpp"
#include "infrastructure/OllamaEmbeddingProvider.hpp"
#include "infrastructure/OllamaGenerationProvider.hpp"
#include "infrastructure/PromptCatalog.hpp"

namespace fs = std::filesystem;
using namespace thoughtflow;

namespace {

struct CliOptions {
    std::string inputPath;
    std::string settingsPath = "settings.json";
    std::string language;
    std::string outputPath;
    std::string format = "json";
    bool saveSettings = false;
};

void PrintUsage() {
    std::cout << "Usage: thoughtflow <input.txt> [--settings file] [--language lang] [--out file]\n"
              << "                   [--format json|mermaid] [--save-settings]\n\n"
              << "Reads one segment per line, builds a mindmap with the local Ollama server\n"
              << "and writes it as JSON (default) or as a Mermaid mindmap." << std::endl;
}

bool ParseArgs(int argc, char** argv, CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& target) {
            if (i + 1 >= argc) {
                std::cerr << "[CLI] Missing value for " << arg << std::endl;
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--settings") {
            if (!next(options.settingsPath)) return false;
        } else if (arg == "--language") {
            if (!next(options.language)) return false;
        } else if (arg == "--out") {
            if (!next(options.outputPath)) return false;
        } else if (arg == "--format") {
            if (!next(options.format)) return false;
        } else if (arg == "--save-settings") {
            options.saveSettings = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "[CLI] Unknown option " << arg << std::endl;
            return false;
        } else if (options.inputPath.empty()) {
            options.inputPath = arg;
        } else {
            std::cerr << "[CLI] Unexpected argument " << arg << std::endl;
            return false;
        }
    }
    if (options.format != "json" && options.format != "mermaid") {
        std::cerr << "[CLI] Unknown format " << options.format << std::endl;
        return false;
    }
    return !options.inputPath.empty();
}

} // namespace

int main(int argc, char** argv) {
    CliOptions options;
    if (!ParseArgs(argc, argv, options)) {
        PrintUsage();
        return 2;
    }

    // Logs go to stderr while stdout carries the mindmap.
    std::optional<infrastructure::ConsoleRedirect> logsToStderr;
    if (options.outputPath.empty()) {
        logsToStderr.emplace(std::cout, std::cerr);
    }

    std::ifstream input(options.inputPath);
    if (!input.is_open()) {
        std::cerr << "[CLI] Cannot open " << options.inputPath << std::endl;
        return 1;
    }
    std::stringstream buffer;
    buffer << input.rdbuf();

    infrastructure::AppConfig config = infrastructure::ConfigLoader::Load(options.settingsPath);
    if (!options.language.empty()) {
        config.mindmap.language = options.language;
    }
    if (options.saveSettings && !infrastructure::ConfigLoader::Save(options.settingsPath, config)) {
        return 1;
    }

    auto prompts = config.ollama.promptsFile.empty()
        ? infrastructure::PromptCatalog::Get()
        : infrastructure::PromptCatalog::LoadOverrides(config.ollama.promptsFile);

    auto cache = std::make_shared<infrastructure::EmbeddingCache>(config.ollama.cacheDir);
    cache->load();

    auto embedder = std::make_shared<infrastructure::OllamaEmbeddingProvider>(config.ollama, cache);
    auto generator = std::make_shared<infrastructure::OllamaGenerationProvider>(config.ollama);
    std::cout << "[CLI] Generation model: " << generator->getCurrentModel() << std::endl;

    application::MindmapPipeline pipeline(embedder, generator, config.mindmap, nullptr, prompts);
    auto result = pipeline.run(application::SegmentNormalizer::SplitLines(buffer.str()));
    if (!cache->persist()) {
        std::cerr << "[CLI] Embedding cache not saved." << std::endl;
    }

    if (!result) {
        std::cerr << "[CLI] " << domain::ErrorKindToString(result.error().kind) << ": "
                  << result.error().message << std::endl;
        return 1;
    }

    std::string rendered = options.format == "mermaid"
        ? application::MindmapExportService::ToMermaidMindmap(result.value())
        : application::MindmapExportService::ToJson(result.value()).dump(2);

    if (options.outputPath.empty()) {
        logsToStderr.reset();
        std::cout << rendered << std::endl;
    } else if (!application::MindmapExportService::WriteFile(options.outputPath, rendered)) {
        return 1;
    } else {
        std::cout << "[CLI] Mindmap written to " << fs::absolute(options.outputPath).string() << std::endl;
    }

    return result.value().validationErrors.empty() ? 0 : 3;
}
