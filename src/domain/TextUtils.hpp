/**
 * @file TextUtils.hpp
 * @brief Byte-safe UTF-8 string helpers shared by the pipeline.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace thoughtflow::domain::text {

std::string Trim(const std::string& input);

/** @brief Replaces every whitespace run with one space and trims the ends. */
std::string CollapseWhitespace(const std::string& input);

/** @brief Drops ASCII and C1 control characters, keeping the rest of the UTF-8 sequence intact. */
std::string RemoveControlCharacters(const std::string& input);

std::string ToLowerAscii(const std::string& input);

bool StartsWithIgnoreCase(const std::string& text, const std::string& prefix);

std::vector<std::string> SplitWords(const std::string& input);

std::size_t CountWords(const std::string& input);

std::string JoinWords(const std::vector<std::string>& words, std::size_t count);

/** @brief Decodes UTF-8 into code points; malformed bytes become U+FFFD. */
std::vector<char32_t> DecodeUtf8(const std::string& input);

std::size_t CodePointCount(const std::string& input);

/** @brief Cuts @p input to at most @p maxCodePoints code points without splitting a sequence. */
std::string TruncateCodePoints(const std::string& input, std::size_t maxCodePoints);

/** @brief Upper-cases the first character when it is ASCII. */
std::string CapitalizeFirst(const std::string& input);

} // namespace thoughtflow::domain::text
