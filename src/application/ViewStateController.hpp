/**
 * @file ViewStateController.hpp
 * @brief Owns the expand/collapse set and the active filter, and re-runs the layout on every change.
 */

#pragma once

#include <functional>
#include <optional>
#include <set>
#include <string>

#include "domain/ProgressModel.hpp"
#include "domain/TreeLayoutEngine.hpp"

namespace progresswalker::application {

/**
 * @class ViewStateController
 * @brief Translates shell intents (toggle, filter) into a fresh TreeLayout.
 *
 * There is no incremental patching: each state change recomputes the whole
 * layout from the current model.
 */
class ViewStateController {
public:
    using LayoutListener = std::function<void(const domain::TreeLayout&)>;

    /**
     * @param model Tree to lay out. Must outlive the controller.
     * @param config Spacing and footprints for the engine.
     * @param expandAllInitially Start with every domain and feature expanded.
     */
    ViewStateController(const domain::ProgressModel& model,
                        domain::LayoutConfig config = domain::LayoutConfig{},
                        bool expandAllInitially = false);

    /**
     * @brief Flips expansion of a domain or feature.
     * A domain wins over a feature with the same id, and both win over the product.
     * @return True if the id was toggleable; product, subtask and unknown ids are no-ops.
     */
    bool toggle(const std::string& id);

    /** @brief Flips expansion of the node at an explicit level. */
    bool toggle(domain::Level level, const std::string& id);

    /** @brief Replaces the active filter. An empty filter shows everything. */
    void setFilter(const std::optional<domain::ProgressFilter>& filter);
    void clearFilter();

    void expandAll();
    void collapseAll();

    /** @brief Re-runs the layout after the model changed underneath. */
    void refresh();

    void setListener(LayoutListener listener) { m_listener = std::move(listener); }

    bool isExpanded(domain::Level level, const std::string& id) const { return m_expanded.count({level, id}) > 0; }
    /** @brief Expanded ids on any level. */
    std::set<std::string> expandedIds() const;
    const domain::LevelExpansion& expanded() const { return m_expanded; }
    const std::optional<domain::ProgressFilter>& filter() const { return m_filter; }
    const domain::TreeLayout& layout() const { return m_layout; }

private:
    void ensureRootExpanded();
    void relayout();

    const domain::ProgressModel& m_model;
    domain::TreeLayoutEngine m_engine;
    domain::LevelExpansion m_expanded;
    std::optional<domain::ProgressFilter> m_filter;
    domain::TreeLayout m_layout;
    LayoutListener m_listener;
};

} // namespace progresswalker::application
