/**
 * @file GenerationRetrier.hpp
 * @brief Bounded retries around the text-generation backend.
 */

#pragma once

#include <memory>
#include <string>

#include "application/generation/CallPacer.hpp"
#include "domain/LanguageProfile.hpp"
#include "domain/Result.hpp"
#include "domain/TextGenerationProvider.hpp"

namespace thoughtflow::application::generation {

/**
 * @class GenerationRetrier
 * @brief Issues the identical prompt until a cleaned response validates.
 *
 * Transport failures and provider exceptions count as failed attempts and
 * never escape. After 1 + maxRetries failed attempts the result carries
 * ErrorKind::GenerationExhausted with the last rejection reason.
 */
class GenerationRetrier {
public:
    GenerationRetrier(std::shared_ptr<domain::TextGenerationProvider> provider,
                      std::shared_ptr<CallPacer> pacer);

    /**
     * @brief Generates a validated, cleaned response.
     * @param prompt Fully formatted prompt, re-sent unchanged on every attempt.
     * @param expectedLanguage Language code or name of the answer.
     * @param maxRetries Additional attempts after the first.
     * @param maxWords Word ceiling for the response.
     */
    domain::Result<std::string> generateValidated(const std::string& prompt,
                                                  const std::string& expectedLanguage,
                                                  int maxRetries,
                                                  int maxWords);

    /** @brief Issues one raw call through the pacer, with no cleaning or validation. */
    domain::Result<std::string> generateRaw(const std::string& prompt);

    int totalAttempts() const { return m_totalAttempts; }

private:
    std::shared_ptr<domain::TextGenerationProvider> m_provider;
    std::shared_ptr<CallPacer> m_pacer;
    int m_totalAttempts = 0;
};

} // namespace thoughtflow::application::generation
