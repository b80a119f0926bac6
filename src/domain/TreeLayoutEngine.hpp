#pragma once

#include "domain/ProgressModel.hpp"
#include "domain/TreeLayout.hpp"
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace progresswalker::domain {

/// Expanded nodes keyed by level, so equal ids on different levels stay independent.
using LevelExpansion = std::set<std::pair<Level, std::string>>;

/**
 * @brief Top-down tree layout of a ProgressModel.
 * This service is stateless: the output depends only on the model, the
 * expanded ids and the filter passed to Compute.
 */
class TreeLayoutEngine {
public:
    explicit TreeLayoutEngine(LayoutConfig config = LayoutConfig{});

    /**
     * @brief Positions every visible node and emits the parent -> child edges.
     * @param model Source tree.
     * @param expandedIds Nodes whose children are shown, matched on any level. Unknown ids are ignored.
     * @param filter Optional filter applied with leaf-up inclusion.
     */
    TreeLayout Compute(const ProgressModel& model,
                       const std::set<std::string>& expandedIds,
                       const std::optional<ProgressFilter>& filter = std::nullopt) const;

    /** @brief Same as Compute, but an entry only expands the node on its own level. */
    TreeLayout ComputeLeveled(const ProgressModel& model,
                              const LevelExpansion& expanded,
                              const std::optional<ProgressFilter>& filter = std::nullopt) const;

    const LayoutConfig& config() const { return m_config; }

private:
    LayoutConfig m_config;
};

} // namespace progresswalker::domain
