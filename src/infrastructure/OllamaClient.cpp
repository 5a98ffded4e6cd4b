/**
 * @file OllamaClient.cpp
 * @brief Implementation of OllamaClient over cpp-httplib.
 */

#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace thoughtflow::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;

void LogFailure(const char* endpoint, const httplib::Result& res) {
    if (res) {
        std::cerr << "[OllamaClient] " << endpoint << " HTTP Error " << res->status << ": " << res->body << std::endl;
    } else {
        std::cerr << "[OllamaClient] " << endpoint << " connection failed: "
                  << httplib::to_string(res.error()) << std::endl;
    }
}
}

OllamaClient::OllamaClient(const std::string& host, int port, int readTimeoutSec)
    : m_host(host), m_port(port), m_readTimeoutSec(readTimeoutSec) {}

std::optional<std::string> OllamaClient::generate(const std::string& model, const std::string& prompt) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(m_readTimeoutSec);

    json requestData = {
        {"model", model},
        {"prompt", prompt},
        {"stream", false},
        {"options", {
            {"temperature", kDeterministicTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        }}
    };

    auto res = cli.Post("/api/generate", requestData.dump(), "application/json");
    if (!res || res->status != 200) {
        LogFailure("/api/generate", res);
        return std::nullopt;
    }
    try {
        auto body = json::parse(res->body);
        if (body.contains("response") && body["response"].is_string()) {
            return body["response"].get<std::string>();
        }
        std::cerr << "[OllamaClient] /api/generate response without 'response' field" << std::endl;
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<domain::EmbeddingMatrix> OllamaClient::embed(const std::string& model,
                                                           const std::vector<std::string>& texts) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(m_readTimeoutSec);

    json requestData = {
        {"model", model},
        {"input", texts}
    };

    auto res = cli.Post("/api/embed", requestData.dump(), "application/json");
    if (!res || res->status != 200) {
        LogFailure("/api/embed", res);
        return std::nullopt;
    }
    try {
        auto body = json::parse(res->body);
        if (body.contains("embeddings") && body["embeddings"].is_array()) {
            auto vectors = body["embeddings"].get<domain::EmbeddingMatrix>();
            if (vectors.size() == texts.size()) {
                return vectors;
            }
            std::cerr << "[OllamaClient] /api/embed returned " << vectors.size() << " vectors for "
                      << texts.size() << " inputs" << std::endl;
        }
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] Embed JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(5);

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (!res || res->status != 200) {
        LogFailure("/api/tags", res);
        return models;
    }
    try {
        auto body = json::parse(res->body);
        if (body.contains("models") && body["models"].is_array()) {
            for (const auto& item : body["models"]) {
                if (item.contains("name")) {
                    models.push_back(item["name"].get<std::string>());
                }
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] Tags JSON Parse Error: " << e.what() << std::endl;
    }
    return models;
}

} // namespace thoughtflow::infrastructure
