/**
 * @file ResponseCleaner.hpp
 * @brief Strips model scaffolding from raw generation output.
 */

#pragma once

#include <string>
#include <vector>

namespace thoughtflow::application::generation {

/**
 * @class ResponseCleaner
 * @brief Removes reasoning blocks, markup, boilerplate prefixes and markdown noise.
 * Cleaning never fails; an empty result is left for the validator to reject.
 */
class ResponseCleaner {
public:
    static std::string Clean(const std::string& raw);

    /** @brief Drops every reasoning block; an unclosed opening tag drops the rest of the text. */
    static std::string StripReasoningBlocks(const std::string& text);

    /** @brief Removes markup tags while keeping the text between them. */
    static std::string StripTags(const std::string& text);

    static std::string StripBoilerplatePrefixes(const std::string& text);

    static std::string StripMarkdown(const std::string& text);

    /** @brief Removes one pair of matching quotes wrapping the whole text. */
    static std::string StripWrappingQuotes(const std::string& text);

    /** @brief True when @p text contains something shaped like <tag>, </tag> or <tag/>. */
    static bool ContainsTag(const std::string& text);

    /** @brief True when an opening or closing reasoning tag survives in @p text. */
    static bool ContainsReasoningMarkup(const std::string& text);

    static const std::vector<std::string>& ReasoningTags();
};

} // namespace thoughtflow::application::generation
