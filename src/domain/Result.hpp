/**
 * @file Result.hpp
 * @brief Error taxonomy and the value-or-error return type used by the pipeline.
 */

#pragma once

#include <string>
#include <utility>
#include <variant>

namespace thoughtflow::domain {

/**
 * @enum ErrorKind
 * @brief Classifies every failure the pipeline can observe.
 */
enum class ErrorKind {
    InputError,           ///< Empty document, misaligned or malformed embeddings.
    ProviderUnavailable,  ///< Embedding provider returned nothing.
    ProviderTransient,    ///< Generation backend failed at transport level.
    GenerationExhausted,  ///< Every generation attempt was rejected.
    ClusteringDegenerate, ///< Partitioning cannot proceed on this input.
    StructuralValidation  ///< Finished tree violates an invariant.
};

inline const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InputError: return "InputError";
        case ErrorKind::ProviderUnavailable: return "ProviderUnavailable";
        case ErrorKind::ProviderTransient: return "ProviderTransient";
        case ErrorKind::GenerationExhausted: return "GenerationExhausted";
        case ErrorKind::ClusteringDegenerate: return "ClusteringDegenerate";
        case ErrorKind::StructuralValidation: return "StructuralValidation";
    }
    return "Unknown";
}

struct Error {
    ErrorKind kind;
    std::string message;
};

/**
 * @class Result
 * @brief Holds either a value or an Error. Callers must check ok() before value().
 */
template <typename T>
class Result {
public:
    Result(T value) : m_data(std::move(value)) {}
    Result(Error error) : m_data(std::move(error)) {}

    static Result Fail(ErrorKind kind, std::string message) {
        return Result(Error{kind, std::move(message)});
    }

    bool ok() const { return std::holds_alternative<T>(m_data); }
    explicit operator bool() const { return ok(); }

    const T& value() const& { return std::get<T>(m_data); }
    T& value() & { return std::get<T>(m_data); }
    T&& value() && { return std::get<T>(std::move(m_data)); }

    const Error& error() const { return std::get<Error>(m_data); }

private:
    std::variant<T, Error> m_data;
};

} // namespace thoughtflow::domain
