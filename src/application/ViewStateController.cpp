#include "application/ViewStateController.hpp"

namespace progresswalker::application {

using namespace progresswalker::domain;

ViewStateController::ViewStateController(const ProgressModel& model, LayoutConfig config, bool expandAllInitially)
    : m_model(model), m_engine(config) {
    if (expandAllInitially) {
        expandAll();
    } else {
        ensureRootExpanded();
        relayout();
    }
}

void ViewStateController::ensureRootExpanded() {
    // The root's children are always reachable; product toggles are no-ops.
    const std::string& rootId = m_model.product().id;
    if (!rootId.empty()) m_expanded.emplace(Level::Product, rootId);
}

bool ViewStateController::toggle(const std::string& id) {
    if (m_model.findDomain(id)) return toggle(Level::Domain, id);
    if (m_model.findFeature(id)) return toggle(Level::Feature, id);
    return false;
}

bool ViewStateController::toggle(Level level, const std::string& id) {
    if (level == Level::Domain) {
        if (!m_model.findDomain(id)) return false;
    } else if (level == Level::Feature) {
        if (!m_model.findFeature(id)) return false;
    } else {
        return false;
    }

    if (m_expanded.erase({level, id}) == 0) {
        m_expanded.emplace(level, id);
    }
    relayout();
    return true;
}

std::set<std::string> ViewStateController::expandedIds() const {
    std::set<std::string> ids;
    for (const auto& entry : m_expanded) ids.insert(entry.second);
    return ids;
}

void ViewStateController::setFilter(const std::optional<ProgressFilter>& filter) {
    if (filter && filter->isEmpty()) {
        m_filter.reset();
    } else {
        m_filter = filter;
    }
    relayout();
}

void ViewStateController::clearFilter() {
    setFilter(std::nullopt);
}

void ViewStateController::expandAll() {
    ensureRootExpanded();
    for (const auto& domain : m_model.product().domains) {
        m_expanded.emplace(Level::Domain, domain.id);
        for (const auto& feature : domain.features) {
            m_expanded.emplace(Level::Feature, feature.id);
        }
    }
    relayout();
}

void ViewStateController::collapseAll() {
    m_expanded.clear();
    ensureRootExpanded();
    relayout();
}

void ViewStateController::refresh() {
    ensureRootExpanded();
    relayout();
}

void ViewStateController::relayout() {
    m_layout = m_engine.ComputeLeveled(m_model, m_expanded, m_filter);
    if (m_listener) m_listener(m_layout);
}

} // namespace progresswalker::application
