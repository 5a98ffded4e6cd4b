/**
 * @file PromptCatalog.cpp
 * @brief Built-in prompt templates, overrides and placeholder formatting.
 */

#include "infrastructure/PromptCatalog.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace thoughtflow::infrastructure {

namespace {

std::mutex g_catalogMutex;
std::shared_ptr<const PromptTemplates> g_templates;
std::optional<std::string> g_overridesPath;

bool IsPlaceholderChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

} // namespace

PromptTemplates PromptCatalog::BuiltIn() {
    PromptTemplates t;
    t.label =
        "You name topics in a mindmap.\n"
        "Write a short topic label in {language} for the passages below.\n\n"
        "RULES:\n"
        "1. Answer with the label only, at most {max_words} words.\n"
        "2. No quotes, no markdown, no explanations, no prefixes such as \"Label:\".\n"
        "3. The label must be written in {language}.\n"
        "4. The label must be narrower than its parent topic.\n\n"
        "Parent topic: {parent_label}\n"
        "Depth in the mindmap: {depth}\n\n"
        "PASSAGES:\n"
        "{texts}";

    t.description =
        "You describe topics in a mindmap.\n"
        "Write one or two sentences in {language} explaining what the passages below have in common.\n\n"
        "RULES:\n"
        "1. At most {max_words} words.\n"
        "2. Plain prose only. Do not start with \"This section\" or \"This cluster\".\n"
        "3. The description must be written in {language}.\n\n"
        "Topic label: {label}\n"
        "Parent topic: {parent_label}\n\n"
        "PASSAGES:\n"
        "{texts}";

    t.rootSummary =
        "Below is the outline of a mindmap built from a single document.\n"
        "Give the whole mindmap a title of at most 6 words and a summary of one or two sentences, "
        "both in {language}.\n\n"
        "Answer with JSON only, exactly in this shape:\n"
        "{\"title\": \"...\", \"summary\": \"...\"}\n\n"
        "OUTLINE:\n"
        "{outline}";
    return t;
}

std::shared_ptr<const PromptTemplates> PromptCatalog::Get() {
    std::lock_guard<std::mutex> lock(g_catalogMutex);
    if (!g_templates) {
        g_templates = std::make_shared<const PromptTemplates>(BuiltIn());
    }
    return g_templates;
}

std::shared_ptr<const PromptTemplates> PromptCatalog::LoadOverrides(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_catalogMutex);
    if (g_overridesPath && *g_overridesPath == path && g_templates) {
        return g_templates;
    }
    if (g_overridesPath) {
        std::cout << "[PromptCatalog] Replacing overrides from " << *g_overridesPath << " with " << path << std::endl;
    }
    g_overridesPath = path;

    PromptTemplates templates = BuiltIn();
    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json j;
            file >> j;
            if (j.contains("label") && j["label"].is_string()) {
                templates.label = j["label"].get<std::string>();
            }
            if (j.contains("description") && j["description"].is_string()) {
                templates.description = j["description"].get<std::string>();
            }
            if (j.contains("root_summary") && j["root_summary"].is_string()) {
                templates.rootSummary = j["root_summary"].get<std::string>();
            }
            std::cout << "[PromptCatalog] Loaded prompt overrides from " << path << std::endl;
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[PromptCatalog] Ignoring invalid " << path << ": " << e.what() << std::endl;
            templates = BuiltIn();
        }
    }

    g_templates = std::make_shared<const PromptTemplates>(std::move(templates));
    return g_templates;
}

std::string PromptCatalog::Format(const std::string& tmpl, const std::map<std::string, std::string>& params) {
    std::string out;
    out.reserve(tmpl.size());
    std::size_t i = 0;
    while (i < tmpl.size()) {
        if (tmpl[i] == '{') {
            std::size_t j = i + 1;
            while (j < tmpl.size() && IsPlaceholderChar(tmpl[j])) ++j;
            if (j > i + 1 && j < tmpl.size() && tmpl[j] == '}') {
                const std::string name = tmpl.substr(i + 1, j - i - 1);
                auto it = params.find(name);
                if (it == params.end()) {
                    throw std::invalid_argument("Missing required prompt parameter: " + name);
                }
                out += it->second;
                i = j + 1;
                continue;
            }
        }
        out.push_back(tmpl[i]);
        ++i;
    }
    return out;
}

} // namespace thoughtflow::infrastructure
