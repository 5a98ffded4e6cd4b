/**
 * @file ResponseCleaner.cpp
 * @brief Implementation of ResponseCleaner.
 */

#include "application/generation/ResponseCleaner.hpp"

#include "domain/TextUtils.hpp"

#include <cctype>

namespace thoughtflow::application::generation {

namespace text = domain::text;

namespace {

const std::vector<std::string> kBoilerplatePrefixes = {
    "Label:", "Output:", "Topic:", "Caption:", "Title:", "Answer:"
};

bool IsAsciiAlpha(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

// Length of the tag starting at @p pos ('<' included), 0 when no tag starts there.
std::size_t TagLengthAt(const std::string& s, std::size_t pos) {
    if (pos >= s.size() || s[pos] != '<') return 0;
    std::size_t i = pos + 1;
    if (i < s.size() && s[i] == '/') ++i;
    if (i >= s.size() || !IsAsciiAlpha(s[i])) return 0;
    std::size_t close = s.find('>', i);
    if (close == std::string::npos) return 0;
    std::size_t lt = s.find('<', i);
    if (lt != std::string::npos && lt < close) return 0;
    return close - pos + 1;
}

// Finds "<name" followed by '>', whitespace or '/' in the lowered text.
std::size_t FindOpeningTag(const std::string& lowered, const std::string& name, std::size_t from) {
    const std::string needle = "<" + name;
    std::size_t pos = lowered.find(needle, from);
    while (pos != std::string::npos) {
        std::size_t after = pos + needle.size();
        if (after >= lowered.size() || lowered[after] == '>' || lowered[after] == '/' ||
            std::isspace(static_cast<unsigned char>(lowered[after]))) {
            return pos;
        }
        pos = lowered.find(needle, pos + 1);
    }
    return std::string::npos;
}

} // namespace

const std::vector<std::string>& ResponseCleaner::ReasoningTags() {
    static const std::vector<std::string> tags = {
        "think", "thinking", "reasoning", "analysis", "scratchpad", "debug"
    };
    return tags;
}

std::string ResponseCleaner::StripReasoningBlocks(const std::string& input) {
    std::string out = input;
    bool changed = true;
    while (changed) {
        changed = false;
        const std::string lowered = text::ToLowerAscii(out);
        for (const auto& tag : ReasoningTags()) {
            std::size_t open = FindOpeningTag(lowered, tag, 0);
            if (open == std::string::npos) continue;

            const std::string closing = "</" + tag + ">";
            std::size_t close = lowered.find(closing, open);
            if (close == std::string::npos) {
                out.erase(open);
            } else {
                out.erase(open, close + closing.size() - open);
            }
            changed = true;
            break;
        }
    }

    // Orphaned closing tags ("junk</think>") take the preceding text with them.
    const std::string lowered = text::ToLowerAscii(out);
    for (const auto& tag : ReasoningTags()) {
        const std::string closing = "</" + tag + ">";
        std::size_t close = lowered.rfind(closing);
        if (close != std::string::npos) {
            return StripReasoningBlocks(out.substr(close + closing.size()));
        }
    }
    return out;
}

std::string ResponseCleaner::StripTags(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        std::size_t len = TagLengthAt(input, i);
        if (len > 0) {
            out.push_back(' ');
            i += len;
            continue;
        }
        out.push_back(input[i]);
        ++i;
    }
    return out;
}

std::string ResponseCleaner::StripBoilerplatePrefixes(const std::string& input) {
    std::string out = text::Trim(input);
    bool changed = true;
    while (changed) {
        changed = false;
        for (const auto& prefix : kBoilerplatePrefixes) {
            if (text::StartsWithIgnoreCase(out, prefix)) {
                out = text::Trim(out.substr(prefix.size()));
                changed = true;
            }
        }
    }
    return out;
}

std::string ResponseCleaner::StripMarkdown(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    bool lineStart = true;
    for (std::size_t i = 0; i < input.size(); ++i) {
        const char c = input[i];
        if (lineStart && c == '#') {
            while (i < input.size() && input[i] == '#') ++i;
            --i;
            lineStart = false;
            continue;
        }
        if ((c == '*' || c == '_') && i + 1 < input.size() && input[i + 1] == c) {
            ++i;
            continue;
        }
        if (c == '`') continue;

        out.push_back(c);
        if (c == '\n') {
            lineStart = true;
        } else if (!std::isspace(static_cast<unsigned char>(c))) {
            lineStart = false;
        }
    }
    return out;
}

std::string ResponseCleaner::StripWrappingQuotes(const std::string& input) {
    if (input.size() >= 2) {
        const char first = input.front();
        const char last = input.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            return text::Trim(input.substr(1, input.size() - 2));
        }
    }
    static const std::string kOpenCurly = "\xE2\x80\x9C";
    static const std::string kCloseCurly = "\xE2\x80\x9D";
    if (input.size() >= kOpenCurly.size() + kCloseCurly.size() &&
        input.compare(0, kOpenCurly.size(), kOpenCurly) == 0 &&
        input.compare(input.size() - kCloseCurly.size(), kCloseCurly.size(), kCloseCurly) == 0) {
        return text::Trim(input.substr(kOpenCurly.size(), input.size() - kOpenCurly.size() - kCloseCurly.size()));
    }
    return input;
}

std::string ResponseCleaner::Clean(const std::string& raw) {
    std::string out = StripReasoningBlocks(raw);
    out = StripTags(out);
    out = StripBoilerplatePrefixes(out);
    out = StripMarkdown(out);
    out = text::CollapseWhitespace(out);
    return StripWrappingQuotes(out);
}

bool ResponseCleaner::ContainsTag(const std::string& input) {
    for (std::size_t i = input.find('<'); i != std::string::npos; i = input.find('<', i + 1)) {
        if (TagLengthAt(input, i) > 0) return true;
    }
    return false;
}

bool ResponseCleaner::ContainsReasoningMarkup(const std::string& input) {
    const std::string lowered = text::ToLowerAscii(input);
    for (const auto& tag : ReasoningTags()) {
        if (FindOpeningTag(lowered, tag, 0) != std::string::npos) return true;
        if (lowered.find("</" + tag + ">") != std::string::npos) return true;
    }
    return false;
}

} // namespace thoughtflow::application::generation
