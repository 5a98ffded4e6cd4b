/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/TextSegment.hpp"

namespace thoughtflow::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434, int readTimeoutSec = 600);

    /** @brief Sends a POST request to /api/generate. */
    std::optional<std::string> generate(const std::string& model, const std::string& prompt);

    /** @brief Sends a POST request to /api/embed with a batch of inputs. */
    std::optional<domain::EmbeddingMatrix> embed(const std::string& model, const std::vector<std::string>& texts);

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels();

private:
    std::string m_host;
    int m_port;
    int m_readTimeoutSec;
};

} // namespace thoughtflow::infrastructure
