/**
 * @file ProgressEntities.hpp
 * @brief Entities of the four-level progress hierarchy.
 */

#pragma once

#include <string>
#include <utility>
#include <vector>
#include "ProgressTypes.hpp"

namespace progresswalker::domain {

/**
 * @struct Subtask
 * @brief Leaf unit of work under a Feature.
 */
struct Subtask {
    std::string id; ///< Unique among subtasks.
    std::string name; ///< Display name.
    int completion = 0; ///< Percentage in [0,100].
    Status status = Status::Pending; ///< Must agree with completion.

    Subtask() = default;
    Subtask(std::string subtaskId, std::string subtaskName, int percent)
        : id(std::move(subtaskId)), name(std::move(subtaskName)), completion(percent),
          status(StatusForCompletion(percent)) {}
};

/**
 * @struct Feature
 * @brief Prioritized unit of product work, optionally broken into subtasks.
 *
 * When subtasks exist the completion is their rounded mean; otherwise it is
 * the authored value.
 */
struct Feature {
    std::string id; ///< Unique among features.
    std::string name;
    int completion = 0;
    Priority priority = Priority::Medium;
    Status status = Status::Pending;
    std::string description;
    std::vector<std::string> dependencies; ///< Ids of other features.
    std::vector<Subtask> subtasks;

    Feature() = default;
    Feature(std::string featureId, std::string featureName, int percent, Priority prio)
        : id(std::move(featureId)), name(std::move(featureName)), completion(percent),
          priority(prio), status(StatusForCompletion(percent)) {}
};

/**
 * @struct Domain
 * @brief Grouping of features. Carries no priority and no stored status.
 */
struct Domain {
    std::string id; ///< Unique among domains.
    std::string name;
    int completion = 0;
    std::string description;
    std::vector<Feature> features;

    Domain() = default;
    Domain(std::string domainId, std::string domainName, int percent = 0)
        : id(std::move(domainId)), name(std::move(domainName)), completion(percent) {}

    /** @brief Display status derived from completion. */
    Status derivedStatus() const { return StatusForCompletion(completion); }
};

/**
 * @struct Product
 * @brief Root of the hierarchy.
 */
struct Product {
    std::string id;
    std::string name;
    int completion = 0;
    std::string description;
    std::vector<Domain> domains;

    Product() = default;
    Product(std::string productId, std::string productName, int percent = 0)
        : id(std::move(productId)), name(std::move(productName)), completion(percent) {}

    Status derivedStatus() const { return StatusForCompletion(completion); }
};

} // namespace progresswalker::domain
