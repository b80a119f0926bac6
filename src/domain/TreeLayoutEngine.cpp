#include "domain/TreeLayoutEngine.hpp"
#include <algorithm>
#include <functional>
#include <initializer_list>

namespace progresswalker::domain {

namespace {
    /**
     * @brief Node of the pruned view: only what survives expansion and filtering.
     */
    struct VisibleNode {
        LayoutNode data;
        std::vector<VisibleNode> children;
    };

    LayoutNode MakeNode(Level level, const std::string& id, const std::string& name, int completion,
                        const std::string& parentId, int childCount, const LayoutConfig& config) {
        const NodeFootprint& fp = config.footprintFor(level);
        LayoutNode node;
        node.id = id;
        node.level = level;
        node.name = name;
        node.completion = completion;
        node.parentId = parentId;
        node.childCount = childCount;
        node.width = fp.width;
        node.height = fp.height;
        return node;
    }
}

TreeLayoutEngine::TreeLayoutEngine(LayoutConfig config) : m_config(config) {}

TreeLayout TreeLayoutEngine::Compute(const ProgressModel& model,
                                     const std::set<std::string>& expandedIds,
                                     const std::optional<ProgressFilter>& filter) const {
    LevelExpansion expanded;
    for (const auto& id : expandedIds) {
        for (Level level : {Level::Product, Level::Domain, Level::Feature}) {
            expanded.emplace(level, id);
        }
    }
    return ComputeLeveled(model, expanded, filter);
}

TreeLayout TreeLayoutEngine::ComputeLeveled(const ProgressModel& model,
                                            const LevelExpansion& expanded,
                                            const std::optional<ProgressFilter>& filter) const {
    TreeLayout layout;
    const Product& product = model.product();
    if (product.id.empty()) return layout;

    std::optional<QueryResult> visibility;
    if (filter && !filter->isEmpty()) visibility = model.query(*filter);

    auto isVisible = [&](Level level, const std::string& id) {
        return !visibility || visibility->isVisible(level, id);
    };
    auto isExpanded = [&](Level level, const std::string& id) { return expanded.count({level, id}) > 0; };

    // --- Visible Tree ---
    VisibleNode root;
    root.data = MakeNode(Level::Product, product.id, product.name, product.completion, "",
                         static_cast<int>(product.domains.size()), m_config);
    root.data.expanded = isExpanded(Level::Product, product.id);

    if (root.data.expanded) {
        for (const auto& domain : product.domains) {
            if (!isVisible(Level::Domain, domain.id)) continue;
            VisibleNode domainNode;
            domainNode.data = MakeNode(Level::Domain, domain.id, domain.name, domain.completion, product.id,
                                       static_cast<int>(domain.features.size()), m_config);
            domainNode.data.expanded = isExpanded(Level::Domain, domain.id);

            if (domainNode.data.expanded) {
                for (const auto& feature : domain.features) {
                    if (!isVisible(Level::Feature, feature.id)) continue;
                    VisibleNode featureNode;
                    featureNode.data = MakeNode(Level::Feature, feature.id, feature.name, feature.completion, domain.id,
                                                static_cast<int>(feature.subtasks.size()), m_config);
                    featureNode.data.status = feature.status;
                    featureNode.data.priority = feature.priority;
                    featureNode.data.expanded = isExpanded(Level::Feature, feature.id);

                    if (featureNode.data.expanded) {
                        for (const auto& subtask : feature.subtasks) {
                            if (!isVisible(Level::Subtask, subtask.id)) continue;
                            VisibleNode subtaskNode;
                            subtaskNode.data = MakeNode(Level::Subtask, subtask.id, subtask.name, subtask.completion,
                                                        feature.id, 0, m_config);
                            subtaskNode.data.status = subtask.status;
                            featureNode.children.push_back(std::move(subtaskNode));
                        }
                    }
                    domainNode.children.push_back(std::move(featureNode));
                }
            }
            root.children.push_back(std::move(domainNode));
        }
    }

    // --- Subtree Width ---
    const float hSpacing = m_config.horizontalSpacing;
    std::function<float(VisibleNode&)> CalcWidth = [&](VisibleNode& u) -> float {
        if (u.children.empty()) {
            u.data.subtreeWidth = u.data.width;
            return u.data.subtreeWidth;
        }
        float childrenW = 0.0f;
        for (size_t i = 0; i < u.children.size(); ++i) {
            if (i > 0) childrenW += hSpacing;
            childrenW += CalcWidth(u.children[i]);
        }
        u.data.subtreeWidth = std::max(u.data.width, childrenW);
        return u.data.subtreeWidth;
    };
    CalcWidth(root);

    // --- Recursive Layout ---
    std::function<void(VisibleNode&, float, int)> LayoutRecursive = [&](VisibleNode& u, float x, int depth) {
        u.data.subtreeX = x;
        u.data.x = x + (u.data.subtreeWidth - u.data.width) / 2.0f;
        u.data.y = m_config.verticalSpacing * static_cast<float>(depth);
        layout.nodes.push_back(u.data);
        layout.totalHeight = std::max(layout.totalHeight, u.data.y + u.data.height);

        float childX = x;
        for (auto& child : u.children) {
            layout.edges.push_back({u.data.id, child.data.id, u.data.level, child.data.level});
            LayoutRecursive(child, childX, depth + 1);
            childX += child.data.subtreeWidth + hSpacing;
        }
    };
    LayoutRecursive(root, 0.0f, 0);

    layout.totalWidth = root.data.subtreeWidth;
    return layout;
}

} // namespace progresswalker::domain
