/**
 * @file ProgressFilter.hpp
 * @brief Filter criteria over the hierarchy and the leaf-up query result.
 */

#pragma once

#include <optional>
#include <set>
#include <string>
#include "ProgressTypes.hpp"

namespace progresswalker::domain {

/**
 * @struct ProgressFilter
 * @brief Conjunctive predicates. Absent fields do not constrain anything.
 *
 * A predicate on an attribute an entity does not carry never matches it:
 * subtasks have no priority, domains have neither status nor priority.
 */
struct ProgressFilter {
    std::optional<Status> status;
    std::optional<Priority> priority;
    std::optional<std::string> namePattern; ///< Case-insensitive substring.

    /** @brief True when no predicate is set (an empty pattern counts as unset). */
    bool isEmpty() const {
        return !status && !priority && (!namePattern || namePattern->empty());
    }

    bool operator==(const ProgressFilter& other) const {
        return status == other.status && priority == other.priority && namePattern == other.namePattern;
    }
    bool operator!=(const ProgressFilter& other) const { return !(*this == other); }
};

/**
 * @struct QueryResult
 * @brief Ids selected by a filter.
 *
 * matched* hold the entities satisfying every predicate. visible* hold the
 * leaf-up closure: matches plus every ancestor needed to reach them.
 */
struct QueryResult {
    std::set<std::string> matchedFeatureIds;
    std::set<std::string> matchedSubtaskIds;

    std::set<std::string> visibleDomainIds;
    std::set<std::string> visibleFeatureIds;
    std::set<std::string> visibleSubtaskIds;

    bool isVisible(Level level, const std::string& id) const {
        switch (level) {
            case Level::Product: return true;
            case Level::Domain: return visibleDomainIds.count(id) > 0;
            case Level::Feature: return visibleFeatureIds.count(id) > 0;
            case Level::Subtask: return visibleSubtaskIds.count(id) > 0;
            default: return false;
        }
    }
};

} // namespace progresswalker::domain
