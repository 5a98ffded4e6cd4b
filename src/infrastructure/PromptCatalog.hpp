/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the generation prompt templates.
 */

#pragma once

#include <map>
#include <memory>
#include <string>

namespace thoughtflow::infrastructure {

/**
 * @struct PromptTemplates
 * @brief One template per generation task, with {placeholder} parameters.
 */
struct PromptTemplates {
    std::string label;       ///< {language} {parent_label} {depth} {max_words} {texts}
    std::string description; ///< {language} {label} {parent_label} {max_words} {texts}
    std::string rootSummary; ///< {language} {outline}
};

/**
 * @class PromptCatalog
 * @brief Loads the templates once per source and shares them read-only afterwards.
 */
class PromptCatalog {
public:
    /** @brief Returns the shared templates, built-ins unless an override was loaded. */
    static std::shared_ptr<const PromptTemplates> Get();

    /**
     * @brief Loads overrides from a prompts.json file, once per path.
     * Keys "label", "description" and "root_summary" replace the built-ins; a
     * missing or unreadable file keeps them. Asking again for the same path
     * returns the cached templates; a different path reloads.
     * @return The shared templates after the load.
     */
    static std::shared_ptr<const PromptTemplates> LoadOverrides(const std::string& path);

    static PromptTemplates BuiltIn();

    /**
     * @brief Substitutes {name} placeholders.
     * @throws std::invalid_argument when the template names a parameter absent from @p params.
     */
    static std::string Format(const std::string& tmpl, const std::map<std::string, std::string>& params);
};

} // namespace thoughtflow::infrastructure
