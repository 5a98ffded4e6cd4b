/**
 * @file GenerationValidator.hpp
 * @brief Structural and language checks on cleaned generation output.
 */

#pragma once

#include <string>

#include "domain/LanguageProfile.hpp"

namespace thoughtflow::application::generation {

struct ValidationResult {
    bool valid = false;
    std::string reason; ///< Empty when valid.
};

/**
 * @class GenerationValidator
 * @brief Applies the acceptance rules in a fixed order and reports the first violation.
 */
class GenerationValidator {
public:
    /** @brief Maximum share of markdown characters (* _ # ~ `) in an accepted response. */
    static constexpr double kMaxMarkdownRatio = 0.10;

    /**
     * @brief Validates an already cleaned candidate.
     * @param candidate Output of ResponseCleaner::Clean.
     * @param language Expected language of the answer.
     * @param maxWords Word ceiling for this request.
     */
    static ValidationResult Validate(const std::string& candidate,
                                     const domain::LanguageProfile& language,
                                     int maxWords);

    static bool StartsWithPreamble(const std::string& candidate);

    static double MarkdownRatio(const std::string& candidate);
};

} // namespace thoughtflow::application::generation
