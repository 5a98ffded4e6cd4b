/**
 * @file OllamaGenerationProvider.hpp
 * @brief TextGenerationProvider backed by a local Ollama server.
 */

#pragma once
#include "domain/TextGenerationProvider.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <string>

namespace thoughtflow::infrastructure {

/**
 * @class OllamaGenerationProvider
 * @brief Implements TextGenerationProvider using /api/generate.
 */
class OllamaGenerationProvider : public domain::TextGenerationProvider {
public:
    /**
     * @brief Constructor for OllamaGenerationProvider.
     * @param settings Host, port and preferred model; the model is auto-selected when enabled.
     */
    explicit OllamaGenerationProvider(const OllamaSettings& settings);

    /** @brief Runs one completion. @see domain::TextGenerationProvider::generate */
    std::optional<std::string> generate(const std::string& prompt) override;

    std::string getCurrentModel() const override { return m_model; }

private:
    void detectBestModel();

    OllamaClient m_client;
    std::string m_model; ///< Target model name.
};

} // namespace thoughtflow::infrastructure
