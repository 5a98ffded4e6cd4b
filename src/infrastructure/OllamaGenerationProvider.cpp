/**
 * @file OllamaGenerationProvider.cpp
 * @brief Implementation of the OllamaGenerationProvider class.
 */
#include "infrastructure/OllamaGenerationProvider.hpp"
#include "infrastructure/ModelSelector.hpp"
#include <iostream>

namespace thoughtflow::infrastructure {

OllamaGenerationProvider::OllamaGenerationProvider(const OllamaSettings& settings)
    : m_client(settings.host, settings.port, settings.readTimeoutSec),
      m_model(settings.generationModel) {
    if (settings.autoSelectModels) {
        detectBestModel();
    }
}

void OllamaGenerationProvider::detectBestModel() {
    auto available = m_client.getAvailableModels();
    if (available.empty()) {
        std::cerr << "[OllamaGenerationProvider] Could not list models, keeping " << m_model << std::endl;
        return;
    }
    std::string selected = ModelSelector::SelectGenerationModel(available, m_model);
    if (selected != m_model) {
        std::cout << "[OllamaGenerationProvider] " << m_model << " not installed, using " << selected << std::endl;
    }
    m_model = selected;
}

std::optional<std::string> OllamaGenerationProvider::generate(const std::string& prompt) {
    return m_client.generate(m_model, prompt);
}

} // namespace thoughtflow::infrastructure
