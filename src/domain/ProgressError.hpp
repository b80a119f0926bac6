/**
 * @file ProgressError.hpp
 * @brief Typed failures returned by ProgressModel operations.
 */

#pragma once

#include <optional>
#include <string>

namespace progresswalker::domain {

/**
 * @enum ErrorCode
 * @brief Failure taxonomy of the progress core.
 */
enum class ErrorCode {
    NotFound,       ///< Referenced parent or entity id is absent.
    InvalidWeights, ///< Weight map is negative or incomplete.
    InvalidEntity   ///< Completion out of range, status mismatch, or id clash.
};

inline std::string ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidWeights: return "InvalidWeights";
        case ErrorCode::InvalidEntity: return "InvalidEntity";
        default: return "Unknown";
    }
}

struct ProgressError {
    ErrorCode code;
    std::string message;
};

/**
 * @struct MutationResult
 * @brief Outcome of a mutating call. On failure the model is unchanged.
 */
struct MutationResult {
    std::optional<ProgressError> error;

    bool ok() const { return !error.has_value(); }

    static MutationResult Success() { return MutationResult{}; }

    static MutationResult Failure(ErrorCode code, std::string message) {
        return MutationResult{ProgressError{code, std::move(message)}};
    }
};

/**
 * @struct ScoreResult
 * @brief Outcome of a weighted score computation.
 */
struct ScoreResult {
    int score = 0;
    std::optional<ProgressError> error;

    bool ok() const { return !error.has_value(); }
};

} // namespace progresswalker::domain
