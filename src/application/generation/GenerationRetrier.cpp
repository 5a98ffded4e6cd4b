/**
 * @file GenerationRetrier.cpp
 * @brief Implementation of GenerationRetrier.
 */

#include "application/generation/GenerationRetrier.hpp"

#include "application/generation/GenerationValidator.hpp"
#include "application/generation/ResponseCleaner.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace thoughtflow::application::generation {

using domain::ErrorKind;
using domain::Result;

GenerationRetrier::GenerationRetrier(std::shared_ptr<domain::TextGenerationProvider> provider,
                                     std::shared_ptr<CallPacer> pacer)
    : m_provider(std::move(provider)), m_pacer(std::move(pacer)) {}

Result<std::string> GenerationRetrier::generateRaw(const std::string& prompt) {
    if (!m_provider) {
        return Result<std::string>::Fail(ErrorKind::ProviderTransient, "no generation provider");
    }
    if (m_pacer) m_pacer->beforeCall();
    ++m_totalAttempts;

    try {
        auto response = m_provider->generate(prompt);
        if (!response) {
            return Result<std::string>::Fail(ErrorKind::ProviderTransient, "provider returned no response");
        }
        return std::string(*response);
    } catch (const std::exception& e) {
        return Result<std::string>::Fail(ErrorKind::ProviderTransient,
                                         std::string("provider error: ") + e.what());
    }
}

Result<std::string> GenerationRetrier::generateValidated(const std::string& prompt,
                                                         const std::string& expectedLanguage,
                                                         int maxRetries,
                                                         int maxWords) {
    const auto language = domain::LanguageProfile::FromName(expectedLanguage);
    const int attempts = 1 + std::max(0, maxRetries);
    std::string lastReason = "no attempt made";

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto raw = generateRaw(prompt);
        if (!raw) {
            lastReason = raw.error().message;
            std::cerr << "[GenerationRetrier] Attempt " << attempt << "/" << attempts
                      << " failed: " << lastReason << std::endl;
            continue;
        }

        std::string cleaned = ResponseCleaner::Clean(raw.value());
        ValidationResult check = GenerationValidator::Validate(cleaned, language, maxWords);
        if (check.valid) {
            return cleaned;
        }
        lastReason = check.reason;
        std::cerr << "[GenerationRetrier] Attempt " << attempt << "/" << attempts
                  << " rejected: " << lastReason << std::endl;
    }

    return Result<std::string>::Fail(ErrorKind::GenerationExhausted,
                                     "exhausted " + std::to_string(attempts) + " attempts: " + lastReason);
}

} // namespace thoughtflow::application::generation
