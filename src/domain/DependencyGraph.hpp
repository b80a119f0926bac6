/**
 * @file DependencyGraph.hpp
 * @brief Directed graph of feature dependencies, validated on demand.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "domain/ProgressModel.hpp"

namespace progresswalker::domain {

/**
 * @struct DanglingDependency
 * @brief A dependency naming a feature id that does not exist.
 */
struct DanglingDependency {
    std::string featureId;
    std::string missingId;
};

/**
 * @struct IntegrityReport
 * @brief Findings of a dependency integrity check.
 */
struct IntegrityReport {
    std::vector<DanglingDependency> dangling;
    std::vector<std::vector<std::string>> cycles; ///< Each cycle lists ids in dependency order.

    bool isClean() const { return dangling.empty() && cycles.empty(); }
};

/**
 * @class DependencyGraph
 * @brief Adjacency list keyed by feature id: feature -> features it depends on.
 *
 * Neither aggregation nor layout reads this graph; it exists for the optional
 * integrity check requested by the progress source.
 */
class DependencyGraph {
public:
    static DependencyGraph FromModel(const ProgressModel& model);

    void addFeature(const std::string& featureId);
    void addDependency(const std::string& featureId, const std::string& dependsOnId);

    const std::vector<std::string>& dependenciesOf(const std::string& featureId) const;
    /** @brief Features that list featureId as a dependency. */
    std::vector<std::string> dependentsOf(const std::string& featureId) const;

    std::vector<DanglingDependency> findDangling() const;

    /**
     * @brief Elementary cycles found by depth-first search, one per back edge.
     * A self-dependency is reported as a one-element cycle.
     */
    std::vector<std::vector<std::string>> findCycles() const;

    IntegrityReport check() const;

    size_t size() const { return m_adjacency.size(); }

private:
    std::map<std::string, std::vector<std::string>> m_adjacency;
};

} // namespace progresswalker::domain
