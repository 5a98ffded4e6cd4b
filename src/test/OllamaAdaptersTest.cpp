#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "infrastructure/EmbeddingCache.hpp"
#include "infrastructure/ModelSelector.hpp"
#include "infrastructure/OllamaEmbeddingProvider.hpp"
#include "infrastructure/OllamaGenerationProvider.hpp"

using namespace thoughtflow::infrastructure;

namespace {

// Nothing listens on port 1, so every request fails fast.
OllamaSettings OfflineSettings(const std::string& cacheDir) {
    OllamaSettings settings;
    settings.host = "127.0.0.1";
    settings.port = 1;
    settings.readTimeoutSec = 1;
    settings.autoSelectModels = false;
    settings.cacheDir = cacheDir;
    return settings;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Ollama Adapters Test..." << std::endl;

    std::string testRoot = "test_project_root_ollama";
    std::filesystem::remove_all(testRoot);

    // 1. Model selection
    {
        assert(ModelSelector::SelectGenerationModel({"mistral:7b", "qwen2.5:7b"}) == "qwen2.5:7b");
        assert(ModelSelector::SelectGenerationModel({"gemma:2b", "llama3:8b"}) == "llama3:8b");
        assert(ModelSelector::SelectGenerationModel({"phi3"}) == "phi3");
        assert(ModelSelector::SelectGenerationModel({"phi3", "custom"}, "custom") == "custom");
        assert(ModelSelector::SelectGenerationModel({}) == "qwen2.5:7b");

        assert(ModelSelector::SelectEmbeddingModel({"llama3", "nomic-embed-text:latest"}) == "nomic-embed-text:latest");
        assert(ModelSelector::SelectEmbeddingModel({"llama3", "bge-m3"}) == "bge-m3");
        assert(ModelSelector::SelectEmbeddingModel({"llama3"}) == "nomic-embed-text");
        std::cout << "[PASS] Model selection." << std::endl;
    }

    // 2. Cache persistence
    {
        EmbeddingCache cache(testRoot);
        cache.update("nomic-embed-text", "solar panels on roofs", {0.25f, 0.5f});
        cache.update("other-model", "solar panels on roofs", {9.0f});
        assert(cache.size() == 2);
        assert(cache.persist());
        assert(std::filesystem::exists(std::filesystem::path(testRoot) / ".embeddings.json"));

        EmbeddingCache reloaded(testRoot);
        reloaded.load();
        assert(reloaded.size() == 2);
        auto hit = reloaded.get("nomic-embed-text", "solar panels on roofs");
        assert(hit && hit->size() == 2 && (*hit)[1] == 0.5f);
        assert(!reloaded.get("nomic-embed-text", "solar panels on walls"));
        assert((*reloaded.get("other-model", "solar panels on roofs"))[0] == 9.0f);

        std::cout << "[PASS] Embedding cache." << std::endl;
    }

    // 2b. Distinct texts never share an entry, and the key survives a reload
    {
        std::string root = testRoot + "/distinct";
        EmbeddingCache cache(root);
        for (int i = 0; i < 500; ++i) {
            // Same length, differing in one character.
            std::string text = "segment-" + std::to_string(1000 + i);
            cache.update("nomic-embed-text", text, {static_cast<float>(i)});
        }
        cache.update("nomic-embed-text", "كتاب جديد", {-1.0f});
        assert(cache.size() == 501);
        assert(cache.persist());

        EmbeddingCache reloaded(root);
        reloaded.load();
        assert(reloaded.size() == 501);
        for (int i = 0; i < 500; ++i) {
            auto hit = reloaded.get("nomic-embed-text", "segment-" + std::to_string(1000 + i));
            assert(hit && hit->size() == 1 && (*hit)[0] == static_cast<float>(i));
        }
        assert((*reloaded.get("nomic-embed-text", "كتاب جديد"))[0] == -1.0f);
        assert(!reloaded.get("other-model", "segment-1000"));
        std::cout << "[PASS] Cache entries keyed by exact text." << std::endl;
    }

    // 2c. A cache written in the older keyed-object layout is ignored, not misread
    {
        std::string root = testRoot + "/legacy";
        std::filesystem::create_directories(root);
        {
            std::ofstream legacy(std::filesystem::path(root) / ".embeddings.json");
            legacy << R"({"nomic-embed-text:12345:5": {"model": "nomic-embed-text", "vector": [1.0]}})";
        }
        EmbeddingCache cache(root);
        cache.load();
        assert(cache.size() == 0);
        assert(!cache.get("nomic-embed-text", "hello"));
        std::cout << "[PASS] Older cache layout ignored." << std::endl;
    }

    // 3. Embedding provider served from the cache, then failing offline
    {
        auto cache = std::make_shared<EmbeddingCache>(testRoot);
        cache->load();
        OllamaEmbeddingProvider provider(OfflineSettings(testRoot), cache);
        assert(provider.model() == "nomic-embed-text");

        auto cached = provider.encode({"solar panels on roofs", "solar panels on roofs"});
        assert(cached && cached->size() == 2);
        assert((*cached)[0] == (*cached)[1]);

        auto offline = provider.encode({"solar panels on roofs", "an unseen passage"});
        assert(!offline);
        std::cout << "[PASS] Embedding provider cache path." << std::endl;
    }

    // 4. Generation provider offline
    {
        OllamaGenerationProvider provider(OfflineSettings(testRoot));
        assert(provider.getCurrentModel() == "qwen2.5:7b");
        assert(!provider.generate("Say hi"));
        std::cout << "[PASS] Generation provider offline." << std::endl;
    }

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] Ollama Adapters Test." << std::endl;
    return 0;
}
