/**
 * @file RootNamer.cpp
 * @brief Implementation of RootNamer.
 */

#include "application/enrichment/RootNamer.hpp"

#include "application/generation/ResponseCleaner.hpp"
#include "domain/LanguageProfile.hpp"
#include "domain/TextUtils.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace thoughtflow::application::enrichment {

namespace text = domain::text;

namespace {

constexpr std::size_t kMaxTitleWords = 6;

std::optional<MindmapTitle> FromJson(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    if (!j.contains("title") || !j["title"].is_string()) return std::nullopt;
    if (!j.contains("summary") || !j["summary"].is_string()) return std::nullopt;

    MindmapTitle result;
    result.title = generation::ResponseCleaner::Clean(j["title"].get<std::string>());
    result.overview = text::CollapseWhitespace(j["summary"].get<std::string>());
    if (result.title.empty() || result.overview.empty()) return std::nullopt;

    const auto words = text::SplitWords(result.title);
    if (words.size() > kMaxTitleWords) {
        result.title = text::JoinWords(words, kMaxTitleWords);
    }
    result.generated = true;
    return result;
}

} // namespace

RootNamer::RootNamer(std::shared_ptr<generation::GenerationRetrier> retrier,
                     std::string language,
                     std::shared_ptr<const infrastructure::PromptTemplates> prompts)
    : m_retrier(std::move(retrier)), m_language(std::move(language)), m_prompts(std::move(prompts)) {
    if (!m_prompts) {
        m_prompts = infrastructure::PromptCatalog::Get();
    }
}

std::string RootNamer::BuildOutline(const domain::ClusterTree& tree) {
    std::ostringstream ss;
    if (tree.empty()) return {};
    for (domain::NodeIndex index : tree.preOrder()) {
        const auto& node = tree.node(index);
        if (!node.label || node.label->empty()) continue;
        ss << std::string(static_cast<std::size_t>(node.depth) * 2, ' ') << "- " << *node.label << ": "
           << node.description.value_or("") << "\n";
    }
    return ss.str();
}

std::optional<MindmapTitle> RootNamer::ParseResponse(const std::string& raw) {
    const std::string stripped = text::Trim(generation::ResponseCleaner::StripReasoningBlocks(raw));
    if (stripped.empty()) return std::nullopt;

    try {
        return FromJson(nlohmann::json::parse(stripped));
    } catch (const nlohmann::json::parse_error&) {
        // Fall through to the embedded-object attempt.
    }

    const std::size_t open = stripped.find('{');
    const std::size_t close = stripped.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close <= open) {
        return std::nullopt;
    }
    try {
        return FromJson(nlohmann::json::parse(stripped.substr(open, close - open + 1)));
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[RootNamer] Could not parse summary JSON: " << e.what() << std::endl;
        return std::nullopt;
    }
}

MindmapTitle RootNamer::name(const domain::ClusterTree& tree) {
    const auto profile = domain::LanguageProfile::FromName(m_language);
    MindmapTitle fallback{kFallbackTitle, profile.noOverviewMessage(), false};

    try {
        const std::string prompt = infrastructure::PromptCatalog::Format(m_prompts->rootSummary, {
            {"language", m_language},
            {"outline", BuildOutline(tree)}
        });

        auto raw = m_retrier->generateRaw(prompt);
        if (!raw) {
            std::cerr << "[RootNamer] Generation failed: " << raw.error().message << std::endl;
            return fallback;
        }
        auto parsed = ParseResponse(raw.value());
        if (!parsed) {
            std::cerr << "[RootNamer] No usable title in response, using fallback." << std::endl;
            return fallback;
        }
        std::cout << "[RootNamer] Title: " << parsed->title << std::endl;
        return *parsed;
    } catch (const std::exception& e) {
        std::cerr << "[RootNamer] Naming failed: " << e.what() << std::endl;
        return fallback;
    }
}

} // namespace thoughtflow::application::enrichment
