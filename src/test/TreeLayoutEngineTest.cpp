#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include "domain/TreeLayoutEngine.hpp"
#include "TestFixtures.hpp"

using namespace progresswalker::domain;

namespace {

bool Near(float a, float b) {
    return std::fabs(a - b) < 0.001f;
}

const LayoutNode& Node(const TreeLayout& layout, Level level, const std::string& id) {
    const LayoutNode* node = layout.find(level, id);
    assert(node && "Expected node missing from layout.");
    return *node;
}

std::vector<const LayoutNode*> ChildrenOf(const TreeLayout& layout, const LayoutNode& parent) {
    std::vector<const LayoutNode*> children;
    for (const auto& edge : layout.edges) {
        if (edge.sourceLevel == parent.level && edge.sourceId == parent.id) {
            children.push_back(layout.find(edge.targetLevel, edge.targetId));
        }
    }
    return children;
}

// Sibling subtrees never overlap, and a parent is centered over its children
// whenever their combined extent is at least as wide as the parent itself.
void AssertGeometry(const TreeLayout& layout) {
    for (const auto& parent : layout.nodes) {
        auto children = ChildrenOf(layout, parent);
        if (children.empty()) {
            assert(Near(parent.subtreeWidth, parent.width));
            continue;
        }
        std::sort(children.begin(), children.end(),
                  [](const LayoutNode* a, const LayoutNode* b) { return a->subtreeX < b->subtreeX; });
        for (size_t i = 1; i < children.size(); ++i) {
            const LayoutNode* left = children[i - 1];
            const LayoutNode* right = children[i];
            assert(left->subtreeX + left->subtreeWidth <= right->subtreeX);
        }
        for (const LayoutNode* child : children) {
            assert(Near(child->y, parent.y + 140.0f));
            assert(child->x >= child->subtreeX);
            assert(child->x + child->width <= child->subtreeX + child->subtreeWidth + 0.001f);
        }
        float extentLeft = children.front()->subtreeX;
        float extentRight = children.back()->subtreeX + children.back()->subtreeWidth;
        if (extentRight - extentLeft >= parent.width) {
            assert(Near(parent.centerX(), (extentLeft + extentRight) / 2.0f));
        }
    }
}

bool SameLayout(const TreeLayout& a, const TreeLayout& b) {
    if (a.nodes.size() != b.nodes.size() || a.edges.size() != b.edges.size()) return false;
    for (size_t i = 0; i < a.nodes.size(); ++i) {
        const auto& n = a.nodes[i];
        const auto& m = b.nodes[i];
        if (n.id != m.id || n.level != m.level || n.x != m.x || n.y != m.y || n.width != m.width ||
            n.height != m.height || n.completion != m.completion || n.status != m.status ||
            n.priority != m.priority || n.subtreeWidth != m.subtreeWidth) {
            return false;
        }
    }
    for (size_t i = 0; i < a.edges.size(); ++i) {
        if (a.edges[i].sourceId != b.edges[i].sourceId || a.edges[i].targetId != b.edges[i].targetId) return false;
    }
    return a.totalWidth == b.totalWidth && a.totalHeight == b.totalHeight;
}

std::set<std::string> AllExpanded() {
    return {"walker", "auth", "reports", "login", "sessions", "csv"};
}

} // namespace

int main() {
    std::cout << "[Test] Starting TreeLayoutEngine Test..." << std::endl;
    ProgressModel model = progresswalker::test::BuildSampleModel();
    TreeLayoutEngine engine;

    std::cout << "[Test] Collapsed root shows only the product..." << std::endl;
    {
        TreeLayout layout = engine.Compute(model, {});
        assert(layout.nodes.size() == 1);
        assert(layout.edges.empty());
        const LayoutNode& root = layout.nodes.front();
        assert(root.id == "walker" && root.level == Level::Product);
        assert(Near(root.x, 0.0f) && Near(root.y, 0.0f));
        assert(Near(root.width, 220.0f) && Near(root.height, 110.0f));
        assert(!root.expanded);
        assert(root.childCount == 2);
        assert(Near(layout.totalWidth, 220.0f));
        assert(!root.status && !root.priority);
    }

    std::cout << "[Test] Exact positions of a partially expanded tree..." << std::endl;
    {
        TreeLayout layout = engine.Compute(model, {"walker", "auth", "login"});

        std::vector<std::string> order;
        for (const auto& node : layout.nodes) order.push_back(node.id);
        assert((order == std::vector<std::string>{"walker", "auth", "login", "form", "creds", "sessions", "reports"}));

        const LayoutNode& walker = Node(layout, Level::Product, "walker");
        assert(Near(walker.subtreeWidth, 1540.0f));
        assert(Near(walker.x, 660.0f) && Near(walker.y, 0.0f));

        const LayoutNode& auth = Node(layout, Level::Domain, "auth");
        assert(Near(auth.subtreeWidth, 1060.0f));
        assert(Near(auth.x, 430.0f) && Near(auth.y, 140.0f));
        assert(auth.expanded);

        const LayoutNode& login = Node(layout, Level::Feature, "login");
        assert(Near(login.subtreeWidth, 600.0f));
        assert(Near(login.x, 210.0f) && Near(login.y, 280.0f));
        assert(login.priority == Priority::Critical);
        assert(login.status == Status::InProgress);
        assert(login.completion == 75);

        const LayoutNode& form = Node(layout, Level::Subtask, "form");
        assert(Near(form.x, 0.0f) && Near(form.y, 420.0f));
        assert(Near(form.width, 160.0f) && Near(form.height, 70.0f));
        assert(form.status == Status::Complete && !form.priority);

        const LayoutNode& creds = Node(layout, Level::Subtask, "creds");
        assert(Near(creds.x, 440.0f) && Near(creds.y, 420.0f));

        const LayoutNode& sessions = Node(layout, Level::Feature, "sessions");
        assert(Near(sessions.x, 880.0f) && Near(sessions.y, 280.0f));
        assert(!sessions.expanded);

        const LayoutNode& reports = Node(layout, Level::Domain, "reports");
        assert(Near(reports.x, 1340.0f) && Near(reports.y, 140.0f));
        assert(!reports.status && !reports.priority);

        assert(layout.edges.size() == 6);
        assert(layout.edges[0].sourceId == "walker" && layout.edges[0].targetId == "auth");
        assert(layout.edges[1].sourceId == "auth" && layout.edges[1].targetId == "login");
        assert(layout.edges[2].sourceId == "login" && layout.edges[2].targetId == "form");
        assert(layout.edges[3].sourceId == "login" && layout.edges[3].targetId == "creds");
        assert(layout.edges[4].sourceId == "auth" && layout.edges[4].targetId == "sessions");
        assert(layout.edges[5].sourceId == "walker" && layout.edges[5].targetId == "reports");

        assert(Near(layout.totalWidth, 1540.0f));
        assert(Near(layout.totalHeight, 490.0f));
        AssertGeometry(layout);
    }

    std::cout << "[Test] Collapsing a domain drops its descendants..." << std::endl;
    {
        TreeLayout expanded = engine.Compute(model, {"walker", "auth", "login"});
        TreeLayout collapsed = engine.Compute(model, {"walker", "login"});

        assert(expanded.contains(Level::Feature, "login"));
        assert(collapsed.nodes.size() == 3);
        assert(!collapsed.contains(Level::Feature, "login"));
        assert(!collapsed.contains(Level::Feature, "sessions"));
        assert(!collapsed.contains(Level::Subtask, "form"));
        for (const auto& edge : collapsed.edges) {
            assert(edge.sourceId == "walker");
        }

        const LayoutNode& auth = Node(collapsed, Level::Domain, "auth");
        assert(Near(auth.subtreeWidth, auth.width));
        assert(Near(auth.x, 0.0f));
        assert(Near(Node(collapsed, Level::Product, "walker").x, 230.0f));
        assert(Near(Node(collapsed, Level::Domain, "reports").x, 480.0f));
        AssertGeometry(collapsed);
    }

    std::cout << "[Test] Filter keeps only the matching path..." << std::endl;
    {
        ProgressFilter filter;
        filter.status = Status::Complete;
        TreeLayout layout = engine.Compute(model, AllExpanded(), filter);

        assert(layout.nodes.size() == 4);
        assert(layout.contains(Level::Product, "walker"));
        assert(layout.contains(Level::Domain, "auth"));
        assert(layout.contains(Level::Feature, "login"));
        assert(layout.contains(Level::Subtask, "form"));
        assert(layout.edges.size() == 3);

        // Filtered siblings take no room.
        assert(Near(Node(layout, Level::Feature, "login").subtreeWidth, 180.0f));
        assert(Near(Node(layout, Level::Product, "walker").subtreeWidth, 220.0f));
        AssertGeometry(layout);

        ProgressFilter low;
        low.priority = Priority::Low;
        layout = engine.Compute(model, AllExpanded(), low);
        assert(layout.nodes.size() == 3);
        assert(layout.contains(Level::Domain, "reports"));
        assert(layout.contains(Level::Feature, "csv"));
        assert(!layout.contains(Level::Domain, "auth"));

        // An empty filter shows everything.
        TreeLayout unfiltered = engine.Compute(model, AllExpanded());
        TreeLayout emptyFilter = engine.Compute(model, AllExpanded(), ProgressFilter{});
        assert(unfiltered.nodes.size() == 8);
        assert(SameLayout(unfiltered, emptyFilter));
        AssertGeometry(unfiltered);
    }

    std::cout << "[Test] Unknown expanded ids are ignored..." << std::endl;
    {
        TreeLayout plain = engine.Compute(model, {"walker", "auth"});
        TreeLayout noisy = engine.Compute(model, {"walker", "auth", "ghost", "deleted-feature"});
        assert(SameLayout(plain, noisy));

        // Expanding a leaf has no visible effect.
        TreeLayout leaf = engine.Compute(model, {"walker", "auth", "form"});
        assert(SameLayout(plain, leaf));
    }

    std::cout << "[Test] Layout is deterministic..." << std::endl;
    {
        ProgressFilter filter;
        filter.namePattern = "s";
        TreeLayout first = engine.Compute(model, AllExpanded(), filter);
        TreeLayout second = engine.Compute(model, AllExpanded(), filter);
        assert(SameLayout(first, second));

        TreeLayoutEngine other;
        assert(SameLayout(first, other.Compute(model, AllExpanded(), filter)));
    }

    std::cout << "[Test] Custom spacing and empty model..." << std::endl;
    {
        LayoutConfig config;
        config.horizontalSpacing = 20.0f;
        config.verticalSpacing = 100.0f;
        TreeLayoutEngine tight(config);
        TreeLayout layout = tight.Compute(model, {"walker"});
        assert(Near(Node(layout, Level::Domain, "reports").x, 220.0f));
        assert(Near(Node(layout, Level::Domain, "reports").y, 100.0f));
        assert(Near(Node(layout, Level::Product, "walker").x, 100.0f));

        ProgressModel empty;
        assert(engine.Compute(empty, {"walker"}).nodes.empty());
    }

    std::cout << "[Test] Leveled expansion only opens the named level..." << std::endl;
    {
        LevelExpansion productOnly = {{Level::Product, "walker"}};
        assert(SameLayout(engine.ComputeLeveled(model, productOnly), engine.Compute(model, {"walker"})));

        // "auth" keyed as a feature does not open the domain of that name.
        LevelExpansion wrongLevel = {{Level::Product, "walker"}, {Level::Feature, "auth"}};
        TreeLayout layout = engine.ComputeLeveled(model, wrongLevel);
        assert(layout.nodes.size() == 3);
        assert(!Node(layout, Level::Domain, "auth").expanded);

        LevelExpansion domainOnly = {{Level::Domain, "auth"}};
        assert(engine.ComputeLeveled(model, domainOnly).nodes.size() == 1);
    }

    std::cout << "[PASS] TreeLayoutEngine Test." << std::endl;
    return 0;
}
