/**
 * @file SegmentNormalizer.cpp
 * @brief Implementation of SegmentNormalizer.
 */

#include "application/SegmentNormalizer.hpp"

#include "domain/TextUtils.hpp"

#include <sstream>

namespace thoughtflow::application {

std::string SegmentNormalizer::CleanText(const std::string& raw) {
    return domain::text::CollapseWhitespace(domain::text::RemoveControlCharacters(raw));
}

std::vector<domain::TextSegment> SegmentNormalizer::Normalize(const std::vector<std::string>& rawSegments) {
    std::vector<domain::TextSegment> segments;
    segments.reserve(rawSegments.size());
    for (const auto& raw : rawSegments) {
        std::string cleaned = CleanText(raw);
        if (domain::text::CodePointCount(cleaned) < kMinSegmentChars) continue;

        domain::TextSegment segment;
        segment.index = static_cast<int>(segments.size());
        segment.rawText = raw;
        segment.cleanedText = std::move(cleaned);
        segments.push_back(std::move(segment));
    }
    return segments;
}

std::vector<std::string> SegmentNormalizer::SplitLines(const std::string& content) {
    std::vector<std::string> lines;
    std::istringstream ss(content);
    std::string line;
    while (std::getline(ss, line)) {
        if (!domain::text::Trim(line).empty()) lines.push_back(line);
    }
    return lines;
}

} // namespace thoughtflow::application
