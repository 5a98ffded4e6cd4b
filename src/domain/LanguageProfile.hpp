/**
 * @file LanguageProfile.hpp
 * @brief Canonical language names, script ranges and localized fallback text.
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace thoughtflow::domain {

/**
 * @class LanguageProfile
 * @brief Everything the validator and the fallbacks need to know about a target language.
 */
class LanguageProfile {
public:
    /**
     * @brief Builds the profile for a language code or name ("ar", "Arabic", "arabic").
     * Unknown languages resolve to English.
     */
    static LanguageProfile FromName(const std::string& language);

    /** @brief Canonical name, e.g. "Arabic". */
    const std::string& name() const { return m_name; }

    /** @brief True when the language is written in a script distinguishable from Latin. */
    bool hasDistinctScript() const { return !m_scriptRanges.empty(); }

    /** @brief True when @p text contains at least one code point of the language's script. */
    bool containsScript(const std::string& text) const;

    bool isRightToLeft() const { return m_rtl; }

    /** @brief Localized "no overview available" sentence. */
    const std::string& noOverviewMessage() const { return m_noOverview; }

    /** @brief Generic description sentence about @p label in this language. */
    std::string fallbackDescription(const std::string& label) const;

private:
    using Range = std::pair<char32_t, char32_t>;

    std::string m_name = "English";
    std::vector<Range> m_scriptRanges;
    bool m_rtl = false;
    std::string m_noOverview = "No overview available.";
    std::string m_descriptionPrefix = "This topic groups passages about";
};

} // namespace thoughtflow::domain
