/**
 * @file EmbeddingCache.cpp
 * @brief Implementation of EmbeddingCache.
 */

#include "infrastructure/EmbeddingCache.hpp"
#include <fstream>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace thoughtflow::infrastructure {

EmbeddingCache::EmbeddingCache(const std::string& cacheDir) : m_cacheDir(cacheDir) {}

void EmbeddingCache::update(const std::string& model, const std::string& text, const std::vector<float>& embedding) {
    m_entries[{model, text}] = embedding;
}

std::optional<std::vector<float>> EmbeddingCache::get(const std::string& model, const std::string& text) const {
    auto it = m_entries.find({model, text});
    if (it != m_entries.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool EmbeddingCache::persist() const {
    if (m_cacheDir.empty()) return false;
    fs::path p = fs::path(m_cacheDir) / ".embeddings.json";

    json j = json::array();
    for (const auto& [key, vector] : m_entries) {
        j.push_back({ {"model", key.first}, {"text", key.second}, {"vector", vector} });
    }

    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
    std::ofstream ofs(p);
    if (!ofs.is_open()) {
        std::cerr << "[EmbeddingCache] Cannot write " << p << std::endl;
        return false;
    }
    ofs << j.dump(4);
    return true;
}

void EmbeddingCache::load() {
    if (m_cacheDir.empty()) return;
    fs::path p = fs::path(m_cacheDir) / ".embeddings.json";
    if (!fs::exists(p)) return;

    m_entries.clear();
    try {
        std::ifstream f(p);
        if (!f.is_open()) return;

        json j = json::parse(f);
        if (!j.is_array()) {
            std::cerr << "[EmbeddingCache] Ignoring cache in an older format: " << p << std::endl;
            return;
        }
        for (const auto& entry : j) {
            if (!entry.is_object() || !entry.contains("model") || !entry.contains("text") || !entry.contains("vector")) {
                continue;
            }
            m_entries[{entry["model"].get<std::string>(), entry["text"].get<std::string>()}] =
                entry["vector"].get<std::vector<float>>();
        }
        std::cout << "[EmbeddingCache] Loaded " << m_entries.size() << " cached embeddings" << std::endl;
    } catch (const json::exception& e) {
        std::cerr << "[EmbeddingCache] Discarding unreadable cache " << p << ": " << e.what() << std::endl;
        m_entries.clear();
    }
}

} // namespace thoughtflow::infrastructure
