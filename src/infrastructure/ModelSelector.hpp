/**
 * @file ModelSelector.hpp
 * @brief Picks the generation and embedding models from what the server offers.
 */

#pragma once
#include <string>
#include <vector>

namespace thoughtflow::infrastructure {

/**
 * @class ModelSelector
 * @brief Separates model selection policy from adapter I/O.
 */
class ModelSelector {
public:
    /** @brief Keeps @p preferred when available, otherwise the first match of the priority list. */
    static std::string SelectGenerationModel(const std::vector<std::string>& availableModels,
                                             const std::string& preferred = "qwen2.5:7b") {
        return Select(availableModels, preferred, {
            "qwen2.5:7b",
            "qwen2.5",
            "llama3",
            "mistral",
            "gemma"
        }, true);
    }

    /** @brief Same policy over embedding models; never falls back to a chat model. */
    static std::string SelectEmbeddingModel(const std::vector<std::string>& availableModels,
                                            const std::string& preferred = "nomic-embed-text") {
        return Select(availableModels, preferred, {
            "nomic-embed-text",
            "mxbai-embed-large",
            "bge-m3",
            "all-minilm",
            "embed"
        }, false);
    }

private:
    static std::string Select(const std::vector<std::string>& availableModels,
                              const std::string& preferred,
                              const std::vector<std::string>& priorities,
                              bool anyAsLastResort) {
        if (availableModels.empty()) {
            return preferred;
        }

        // A configured model that is installed always wins; tags may carry ":latest".
        for (const auto& model : availableModels) {
            if (model == preferred || model == preferred + ":latest") {
                return model;
            }
        }

        for (const auto& priority : priorities) {
            for (const auto& model : availableModels) {
                if (model.find(priority) != std::string::npos) {
                    return model;
                }
            }
        }

        return anyAsLastResort ? availableModels[0] : preferred;
    }
};

} // namespace thoughtflow::infrastructure
