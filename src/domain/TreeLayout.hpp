/**
 * @file TreeLayout.hpp
 * @brief Positioned nodes and edges produced by the TreeLayoutEngine.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "ProgressTypes.hpp"

namespace progresswalker::domain {

/**
 * @struct NodeFootprint
 * @brief Fixed box size of every node on one level.
 */
struct NodeFootprint {
    float width;
    float height;
};

/**
 * @struct LayoutConfig
 * @brief Spacing constants and per-level footprints of a top-down tree.
 */
struct LayoutConfig {
    float horizontalSpacing = 280.0f; ///< Gap between sibling subtrees.
    float verticalSpacing = 140.0f;   ///< Distance between consecutive levels.
    NodeFootprint product{220.0f, 110.0f};
    NodeFootprint domain{200.0f, 100.0f};
    NodeFootprint feature{180.0f, 90.0f};
    NodeFootprint subtask{160.0f, 70.0f};

    const NodeFootprint& footprintFor(Level level) const {
        switch (level) {
            case Level::Product: return product;
            case Level::Domain: return domain;
            case Level::Feature: return feature;
            case Level::Subtask:
            default: return subtask;
        }
    }

    /** @brief Footprints must shrink strictly from Product down to Subtask. */
    bool isValid() const {
        auto shrinks = [](const NodeFootprint& a, const NodeFootprint& b) {
            return a.width > b.width && a.height > b.height;
        };
        return horizontalSpacing >= 0.0f && verticalSpacing >= 0.0f &&
               subtask.width > 0.0f && subtask.height > 0.0f &&
               shrinks(product, domain) && shrinks(domain, feature) && shrinks(feature, subtask);
    }
};

/**
 * @struct LayoutNode
 * @brief One visible node, in absolute layout coordinates (top-left corner).
 */
struct LayoutNode {
    std::string id;
    Level level = Level::Product;
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    int completion = 0;
    std::optional<Status> status;     ///< Features and subtasks only.
    std::optional<Priority> priority; ///< Features only.

    std::string name;
    std::string parentId;     ///< Empty for the product.
    bool expanded = false;    ///< Children are part of the layout.
    int childCount = 0;       ///< Children in the model, visible or not.
    float subtreeX = 0.0f;    ///< Left edge of the node's subtree.
    float subtreeWidth = 0.0f;

    float centerX() const { return x + width * 0.5f; }
};

/**
 * @struct LayoutEdge
 * @brief Parent to child connection. Levels disambiguate ids shared across levels.
 */
struct LayoutEdge {
    std::string sourceId;
    std::string targetId;
    Level sourceLevel = Level::Product;
    Level targetLevel = Level::Domain;
};

/**
 * @struct TreeLayout
 * @brief Complete output of one layout pass: nodes in pre-order, then edges.
 */
struct TreeLayout {
    std::vector<LayoutNode> nodes;
    std::vector<LayoutEdge> edges;
    float totalWidth = 0.0f;
    float totalHeight = 0.0f;

    const LayoutNode* find(Level level, const std::string& id) const {
        for (const auto& node : nodes) {
            if (node.level == level && node.id == id) return &node;
        }
        return nullptr;
    }

    bool contains(Level level, const std::string& id) const { return find(level, id) != nullptr; }
};

} // namespace progresswalker::domain
