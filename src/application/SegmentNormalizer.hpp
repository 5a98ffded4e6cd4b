/**
 * @file SegmentNormalizer.hpp
 * @brief Turns raw text lines into indexed segments.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/TextSegment.hpp"

namespace thoughtflow::application {

/**
 * @class SegmentNormalizer
 * @brief Collapses whitespace, removes control characters and drops fragments.
 */
class SegmentNormalizer {
public:
    static constexpr std::size_t kMinSegmentChars = 10;

    /**
     * @brief Normalizes @p rawSegments.
     * @return Kept segments, re-indexed 0..n-1 in input order.
     */
    static std::vector<domain::TextSegment> Normalize(const std::vector<std::string>& rawSegments);

    static std::string CleanText(const std::string& raw);

    /** @brief One segment per non-blank line of @p content. */
    static std::vector<std::string> SplitLines(const std::string& content);
};

} // namespace thoughtflow::application
