/**
 * @file GenerationValidator.cpp
 * @brief Implementation of GenerationValidator.
 */

#include "application/generation/GenerationValidator.hpp"

#include "application/generation/ResponseCleaner.hpp"
#include "domain/TextUtils.hpp"

#include <cctype>
#include <utility>
#include <vector>

namespace thoughtflow::application::generation {

namespace text = domain::text;

namespace {

const std::vector<std::string> kPreambles = {
    "This section", "This cluster", "This text", "These texts",
    "Description:", "Label:", "Here is", "Here's", "Sure", "As an AI"
};

ValidationResult Reject(std::string reason) {
    return ValidationResult{false, std::move(reason)};
}

} // namespace

bool GenerationValidator::StartsWithPreamble(const std::string& candidate) {
    for (const auto& preamble : kPreambles) {
        if (!text::StartsWithIgnoreCase(candidate, preamble)) continue;
        // "Sure" must not match "Surface".
        const unsigned char last = static_cast<unsigned char>(preamble.back());
        if (!std::isalpha(last) || candidate.size() == preamble.size()) return true;
        if (!std::isalnum(static_cast<unsigned char>(candidate[preamble.size()]))) return true;
    }
    return false;
}

double GenerationValidator::MarkdownRatio(const std::string& candidate) {
    const auto codePoints = text::DecodeUtf8(candidate);
    if (codePoints.empty()) return 0.0;
    std::size_t markers = 0;
    for (char32_t cp : codePoints) {
        if (cp == U'*' || cp == U'_' || cp == U'#' || cp == U'~' || cp == U'`') ++markers;
    }
    return static_cast<double>(markers) / static_cast<double>(codePoints.size());
}

ValidationResult GenerationValidator::Validate(const std::string& candidate,
                                               const domain::LanguageProfile& language,
                                               int maxWords) {
    const std::string trimmed = text::Trim(candidate);
    if (trimmed.empty()) {
        return Reject("empty response");
    }
    if (ResponseCleaner::ContainsReasoningMarkup(trimmed)) {
        return Reject("residual reasoning markup");
    }
    if (ResponseCleaner::ContainsTag(trimmed)) {
        return Reject("leftover markup tags");
    }
    if (StartsWithPreamble(trimmed)) {
        return Reject("explanatory preamble");
    }
    if (language.hasDistinctScript() && !language.containsScript(trimmed)) {
        return Reject("no " + language.name() + " script characters");
    }
    if (MarkdownRatio(trimmed) > kMaxMarkdownRatio) {
        return Reject("too much markdown formatting");
    }
    const std::size_t words = text::CountWords(trimmed);
    if (maxWords > 0 && words > static_cast<std::size_t>(maxWords)) {
        return Reject("too long (" + std::to_string(words) + " words, limit " + std::to_string(maxWords) + ")");
    }
    return ValidationResult{true, {}};
}

} // namespace thoughtflow::application::generation
