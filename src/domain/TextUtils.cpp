/**
 * @file TextUtils.cpp
 * @brief Implementation of the UTF-8 string helpers.
 */

#include "domain/TextUtils.hpp"

#include <cctype>
#include <sstream>

namespace thoughtflow::domain::text {

namespace {

constexpr char32_t kReplacementCharacter = 0xFFFD;

bool IsAsciiSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Length of the UTF-8 sequence introduced by lead byte @p c, 0 when invalid.
std::size_t SequenceLength(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 0;
}

} // namespace

std::string Trim(const std::string& input) {
    std::size_t start = 0;
    while (start < input.size() && IsAsciiSpace(static_cast<unsigned char>(input[start]))) ++start;
    std::size_t end = input.size();
    while (end > start && IsAsciiSpace(static_cast<unsigned char>(input[end - 1]))) --end;
    return input.substr(start, end - start);
}

std::string CollapseWhitespace(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    bool lastWasSpace = false;
    for (unsigned char c : input) {
        if (IsAsciiSpace(c)) {
            if (!lastWasSpace && !out.empty()) {
                out.push_back(' ');
            }
            lastWasSpace = true;
            continue;
        }
        out.push_back(static_cast<char>(c));
        lastWasSpace = false;
    }
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::string RemoveControlCharacters(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if (c < 0x20 || c == 0x7F) {
            // Whitespace controls survive as a space so words do not merge.
            if (IsAsciiSpace(c)) out.push_back(' ');
            continue;
        }
        // C1 controls (U+0080..U+009F) are encoded as C2 80..C2 9F.
        if (c == 0xC2 && i + 1 < input.size()) {
            unsigned char next = static_cast<unsigned char>(input[i + 1]);
            if (next >= 0x80 && next <= 0x9F) {
                ++i;
                continue;
            }
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::string ToLowerAscii(const std::string& input) {
    std::string out = input;
    for (auto& ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

bool StartsWithIgnoreCase(const std::string& text, const std::string& prefix) {
    if (prefix.size() > text.size()) return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> SplitWords(const std::string& input) {
    std::vector<std::string> words;
    std::istringstream ss(input);
    std::string word;
    while (ss >> word) {
        words.push_back(word);
    }
    return words;
}

std::size_t CountWords(const std::string& input) {
    return SplitWords(input).size();
}

std::string JoinWords(const std::vector<std::string>& words, std::size_t count) {
    std::string out;
    for (std::size_t i = 0; i < words.size() && i < count; ++i) {
        if (i > 0) out.push_back(' ');
        out += words[i];
    }
    return out;
}

std::vector<char32_t> DecodeUtf8(const std::string& input) {
    std::vector<char32_t> out;
    out.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        unsigned char lead = static_cast<unsigned char>(input[i]);
        std::size_t len = SequenceLength(lead);
        if (len == 0 || i + len > input.size()) {
            out.push_back(kReplacementCharacter);
            ++i;
            continue;
        }

        char32_t cp = 0;
        if (len == 1) {
            cp = lead;
        } else {
            cp = lead & (0xFF >> (len + 1));
            bool valid = true;
            for (std::size_t k = 1; k < len; ++k) {
                unsigned char cont = static_cast<unsigned char>(input[i + k]);
                if ((cont & 0xC0) != 0x80) {
                    valid = false;
                    break;
                }
                cp = (cp << 6) | (cont & 0x3F);
            }
            if (!valid) {
                out.push_back(kReplacementCharacter);
                ++i;
                continue;
            }
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

std::size_t CodePointCount(const std::string& input) {
    return DecodeUtf8(input).size();
}

std::string TruncateCodePoints(const std::string& input, std::size_t maxCodePoints) {
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < input.size()) {
        if (count == maxCodePoints) {
            return input.substr(0, i);
        }
        std::size_t len = SequenceLength(static_cast<unsigned char>(input[i]));
        if (len == 0 || i + len > input.size()) len = 1;
        i += len;
        ++count;
    }
    return input;
}

std::string CapitalizeFirst(const std::string& input) {
    if (input.empty()) return input;
    std::string out = input;
    unsigned char first = static_cast<unsigned char>(out[0]);
    if (first < 0x80) {
        out[0] = static_cast<char>(std::toupper(first));
    }
    return out;
}

} // namespace thoughtflow::domain::text
