/**
 * @file ProgressTypes.hpp
 * @brief Value types shared by the progress hierarchy: levels, statuses and priorities.
 */

#pragma once

#include <optional>
#include <string>

namespace progresswalker::domain {

/**
 * @enum Level
 * @brief Depth of an entity in the Product -> Domain -> Feature -> Subtask hierarchy.
 */
enum class Level {
    Product = 0,
    Domain = 1,
    Feature = 2,
    Subtask = 3
};

/**
 * @enum Status
 * @brief Tri-state classification of a completion percentage.
 */
enum class Status {
    Pending,    ///< completion == 0
    InProgress, ///< 0 < completion < 100
    Complete    ///< completion == 100
};

/**
 * @enum Priority
 * @brief Feature urgency tag, used only for weighted scoring and filtering.
 */
enum class Priority {
    Critical,
    High,
    Medium,
    Low
};

inline constexpr int kMinCompletion = 0;
inline constexpr int kMaxCompletion = 100;

inline bool IsValidCompletion(int completion) {
    return completion >= kMinCompletion && completion <= kMaxCompletion;
}

/**
 * @brief The only status consistent with a given completion value.
 */
inline Status StatusForCompletion(int completion) {
    if (completion >= kMaxCompletion) return Status::Complete;
    if (completion <= kMinCompletion) return Status::Pending;
    return Status::InProgress;
}

/**
 * @brief Ordering rank where a lower value means more urgent (CRITICAL = 0).
 */
inline int PriorityRank(Priority priority) {
    return static_cast<int>(priority);
}

inline std::string LevelToString(Level level) {
    switch (level) {
        case Level::Product: return "product";
        case Level::Domain: return "domain";
        case Level::Feature: return "feature";
        case Level::Subtask: return "subtask";
        default: return "unknown";
    }
}

inline std::string StatusToString(Status status) {
    switch (status) {
        case Status::Pending: return "pending";
        case Status::InProgress: return "in-progress";
        case Status::Complete: return "complete";
        default: return "unknown";
    }
}

inline std::string PriorityToString(Priority priority) {
    switch (priority) {
        case Priority::Critical: return "CRITICAL";
        case Priority::High: return "HIGH";
        case Priority::Medium: return "MEDIUM";
        case Priority::Low: return "LOW";
        default: return "UNKNOWN";
    }
}

inline std::optional<Status> ParseStatus(const std::string& text) {
    if (text == "pending") return Status::Pending;
    if (text == "in-progress") return Status::InProgress;
    if (text == "complete") return Status::Complete;
    return std::nullopt;
}

inline std::optional<Priority> ParsePriority(const std::string& text) {
    if (text == "CRITICAL") return Priority::Critical;
    if (text == "HIGH") return Priority::High;
    if (text == "MEDIUM") return Priority::Medium;
    if (text == "LOW") return Priority::Low;
    return std::nullopt;
}

} // namespace progresswalker::domain
