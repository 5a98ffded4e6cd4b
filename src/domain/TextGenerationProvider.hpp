/**
 * @file TextGenerationProvider.hpp
 * @brief Interface for the freeform text-generation backend.
 */

#pragma once

#include <optional>
#include <string>

namespace thoughtflow::domain {

/**
 * @class TextGenerationProvider
 * @brief Prompt in, text out. No structural guarantee on the text.
 */
class TextGenerationProvider {
public:
    virtual ~TextGenerationProvider() = default;

    /**
     * @brief Runs one completion.
     * @param prompt Fully formatted prompt.
     * @return The raw response (possibly empty or malformed), or nullopt on transport failure.
     */
    virtual std::optional<std::string> generate(const std::string& prompt) = 0;

    /** @brief Name of the model answering requests, for logs and output metadata. */
    virtual std::string getCurrentModel() const { return "unknown"; }
};

} // namespace thoughtflow::domain
