/**
 * @file ProgressModel.hpp
 * @brief Aggregate root owning the progress hierarchy and its derived completion values.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "ProgressEntities.hpp"
#include "ProgressError.hpp"
#include "ProgressFilter.hpp"

namespace progresswalker::domain {

/**
 * @brief Weight applied to each priority by computeWeightedScore.
 */
using PriorityWeights = std::map<Priority, double>;

/**
 * @struct LevelSummary
 * @brief Status counts for one level of the hierarchy.
 */
struct LevelSummary {
    int total = 0;
    int complete = 0;
    int inProgress = 0;
    int pending = 0;
    int percentComplete = 0; ///< round(complete / total * 100), 0 when empty.
};

/**
 * @struct ProgressSummary
 * @brief Snapshot of the whole tree, per level.
 */
struct ProgressSummary {
    int productCompletion = 0;
    LevelSummary domains;
    LevelSummary features;
    LevelSummary subtasks;
};

/**
 * @class ProgressModel
 * @brief Holds the Product -> Domain -> Feature -> Subtask tree.
 *
 * Every successful mutation recomputes the completion of all ancestors of the
 * touched entity, bottom-up. Failed mutations leave the tree untouched.
 * Domain and product completion are authored-with-override: a stored value
 * survives only while the entity has no children.
 */
class ProgressModel {
public:
    ProgressModel() = default;

    /** @brief Read access to the whole tree. */
    const Product& product() const { return m_product; }

    /**
     * @brief Authors the root's attributes. Existing domains are kept.
     */
    MutationResult setProduct(const Product& product);

    /**
     * @brief Inserts or updates a domain under the product.
     * @param productId Must equal the root id, else NotFound.
     * @param domain Payload; a non-empty feature list replaces the stored features.
     */
    MutationResult upsertDomain(const std::string& productId, const Domain& domain);

    /**
     * @brief Inserts or updates a feature under a domain.
     *
     * A feature created without subtasks keeps its authored completion.
     * A non-empty subtask list in the payload replaces the stored subtasks.
     */
    MutationResult upsertFeature(const std::string& domainId, const Feature& feature);

    /**
     * @brief Inserts or updates a subtask under a feature.
     * @return NotFound if featureId is absent, InvalidEntity on bad payload.
     */
    MutationResult upsertSubtask(const std::string& featureId, const Subtask& subtask);

    MutationResult removeDomain(const std::string& domainId);
    MutationResult removeFeature(const std::string& featureId);
    MutationResult removeSubtask(const std::string& subtaskId);

    /**
     * @brief Full bottom-up recomputation pass. Idempotent.
     */
    void recomputeAll();

    /**
     * @brief Priority-weighted average of domain completion.
     *
     * Each domain with at least one feature contributes completion * weight,
     * where weight is that of its highest-priority feature. Domains without
     * features carry no priority and are skipped.
     */
    ScoreResult computeWeightedScore(const PriorityWeights& priorityWeights) const;

    /**
     * @brief Selects features and subtasks matching every predicate, plus the
     *        ancestors required to reach them.
     */
    QueryResult query(const ProgressFilter& filter) const;

    /** @brief Counts per level, as shown in the shell's summary badges. */
    ProgressSummary summarize() const;

    const Domain* findDomain(const std::string& domainId) const;
    const Feature* findFeature(const std::string& featureId) const;
    const Subtask* findSubtask(const std::string& subtaskId) const;

    /** @brief Id of the domain owning a feature, empty if unknown. */
    std::string domainOfFeature(const std::string& featureId) const;
    /** @brief Id of the feature owning a subtask, empty if unknown. */
    std::string featureOfSubtask(const std::string& subtaskId) const;

    /** @brief Level of an id, probing Product, Domain, Feature, Subtask in that order. */
    bool resolveLevel(const std::string& id, Level& levelOut) const;

private:
    Domain* findDomainMutable(const std::string& domainId);
    Feature* findFeatureMutable(const std::string& featureId, Domain** ownerOut = nullptr);

    MutationResult validateSubtask(const Subtask& subtask) const;
    MutationResult validateFeature(const Feature& feature, const std::string& domainId) const;
    MutationResult validateDomain(const Domain& domain) const;

    static void recomputeFeature(Feature& feature);
    static void recomputeDomain(Domain& domain);
    void recomputeProduct();

    Product m_product;
};

} // namespace progresswalker::domain
