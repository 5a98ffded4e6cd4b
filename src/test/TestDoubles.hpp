/**
 * @file TestDoubles.hpp
 * @brief Scripted providers shared by the test executables.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/generation/CallPacer.hpp"
#include "domain/EmbeddingProvider.hpp"
#include "domain/TextGenerationProvider.hpp"

namespace thoughtflow::test {

/** @brief Answers every prompt through a callback and records what it was asked. */
class ScriptedGenerationProvider : public domain::TextGenerationProvider {
public:
    using Responder = std::function<std::optional<std::string>(const std::string& prompt, int callIndex)>;

    explicit ScriptedGenerationProvider(Responder responder) : m_responder(std::move(responder)) {}

    /** @brief Always answers @p fixed. */
    static std::shared_ptr<ScriptedGenerationProvider> Constant(const std::string& fixed) {
        return std::make_shared<ScriptedGenerationProvider>(
            [fixed](const std::string&, int) { return std::optional<std::string>(fixed); });
    }

    /** @brief Answers from @p replies in order, repeating the last one. */
    static std::shared_ptr<ScriptedGenerationProvider> Sequence(std::vector<std::optional<std::string>> replies) {
        return std::make_shared<ScriptedGenerationProvider>(
            [replies](const std::string&, int call) {
                const std::size_t i = std::min(static_cast<std::size_t>(call), replies.size() - 1);
                return replies[i];
            });
    }

    std::optional<std::string> generate(const std::string& prompt) override {
        prompts.push_back(prompt);
        return m_responder(prompt, static_cast<int>(prompts.size()) - 1);
    }

    std::string getCurrentModel() const override { return "scripted"; }

    int calls() const { return static_cast<int>(prompts.size()); }

    std::vector<std::string> prompts;

private:
    Responder m_responder;
};

/** @brief Returns preset vectors in order, or nothing when unavailable. */
class FixedEmbeddingProvider : public domain::EmbeddingProvider {
public:
    explicit FixedEmbeddingProvider(domain::EmbeddingMatrix vectors, bool available = true)
        : m_vectors(std::move(vectors)), m_available(available) {}

    std::optional<domain::EmbeddingMatrix> encode(const std::vector<std::string>& texts) override {
        batchSizes.push_back(static_cast<int>(texts.size()));
        if (!m_available) return std::nullopt;
        domain::EmbeddingMatrix out;
        for (std::size_t i = 0; i < texts.size(); ++i) {
            out.push_back(m_vectors.at(m_next++));
        }
        return out;
    }

    std::vector<int> batchSizes;

private:
    domain::EmbeddingMatrix m_vectors;
    bool m_available;
    std::size_t m_next = 0;
};

/** @brief Pacer that records requested sleeps instead of sleeping. */
inline std::shared_ptr<application::generation::CallPacer> MakeRecordingPacer(
    std::vector<std::chrono::milliseconds>& sleeps, std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
    return std::make_shared<application::generation::CallPacer>(
        delay, [&sleeps](std::chrono::milliseconds d) { sleeps.push_back(d); });
}

/** @brief Orthogonal-ish unit vectors: point i lies along axis (i % dims), scaled slightly by i. */
inline domain::EmbeddingMatrix AxisEmbeddings(int count, int dims) {
    domain::EmbeddingMatrix m;
    for (int i = 0; i < count; ++i) {
        domain::EmbeddingVector v(static_cast<std::size_t>(dims), 0.0f);
        v[static_cast<std::size_t>(i % dims)] = 1.0f + 0.01f * static_cast<float>(i);
        m.push_back(v);
    }
    return m;
}

} // namespace thoughtflow::test
