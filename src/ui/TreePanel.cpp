#include "ui/TreePanel.hpp"
#include "imgui.h"
#include "imnodes.h"

namespace progresswalker::ui {

using namespace progresswalker::domain;

namespace {
    ImU32 StatusColor(Status status) {
        switch (status) {
            case Status::Complete: return IM_COL32(16, 185, 129, 220);
            case Status::InProgress: return IM_COL32(245, 158, 11, 220);
            case Status::Pending:
            default: return IM_COL32(107, 114, 128, 220);
        }
    }

    ImU32 PriorityColor(Priority priority) {
        switch (priority) {
            case Priority::Critical: return IM_COL32(239, 68, 68, 220);
            case Priority::High: return IM_COL32(249, 115, 22, 220);
            case Priority::Medium: return IM_COL32(59, 130, 246, 220);
            case Priority::Low:
            default: return IM_COL32(107, 114, 128, 220);
        }
    }

    ImU32 TitleColor(const LayoutNode& node) {
        switch (node.level) {
            case Level::Product: return IM_COL32(5, 150, 105, 220);
            case Level::Domain: return IM_COL32(37, 99, 235, 220);
            case Level::Feature: return node.priority ? PriorityColor(*node.priority) : IM_COL32(124, 58, 237, 220);
            case Level::Subtask:
            default: return node.status ? StatusColor(*node.status) : IM_COL32(13, 148, 136, 220);
        }
    }

    void DrawLevelSummary(const char* label, const LevelSummary& s) {
        ImGui::Text("%s: %d/%d complete (%d%%)", label, s.complete, s.total, s.percentComplete);
        ImGui::TextDisabled("  %d in progress, %d pending", s.inProgress, s.pending);
    }
}

void DrawFilterToolbar(ViewerState& state) {
    static const char* kStatusItems[] = {"All statuses", "pending", "in-progress", "complete"};
    static const char* kPriorityItems[] = {"All priorities", "CRITICAL", "HIGH", "MEDIUM", "LOW"};

    bool changed = false;
    ImGui::SetNextItemWidth(160.0f);
    changed |= ImGui::Combo("##status", &state.filterInputs.statusIndex, kStatusItems, IM_ARRAYSIZE(kStatusItems));
    ImGui::SameLine();
    ImGui::SetNextItemWidth(160.0f);
    changed |= ImGui::Combo("##priority", &state.filterInputs.priorityIndex, kPriorityItems, IM_ARRAYSIZE(kPriorityItems));
    ImGui::SameLine();
    ImGui::SetNextItemWidth(240.0f);
    changed |= ImGui::InputTextWithHint("##search", "Search by name...", state.filterInputs.search,
                                        sizeof(state.filterInputs.search));
    if (changed) state.ApplyFilterInputs();

    ImGui::SameLine();
    if (ImGui::Button("Clear")) {
        state.filterInputs = FilterInputs{};
        state.controller->clearFilter();
    }
    ImGui::SameLine();
    if (ImGui::Button("Expand all")) state.controller->expandAll();
    ImGui::SameLine();
    if (ImGui::Button("Collapse all")) state.controller->collapseAll();

    ImGui::SameLine();
    bool expandedByDefault = state.settings.expandedByDefault;
    if (ImGui::Checkbox("Expand by default", &expandedByDefault)) {
        state.SetExpandedByDefault(expandedByDefault);
    }
    ImGui::SameLine();
    if (ImGui::Button("Export layout")) state.ExportLayout();

    if (!state.statusMessage.empty()) {
        ImGui::TextDisabled("%s", state.statusMessage.c_str());
    }
}

void DrawProgressTree(ViewerState& state) {
    const TreeLayout& layout = state.controller->layout();

    ImNodes::EditorContextSet(static_cast<ImNodesEditorContext*>(state.graphContext));
    ImNodes::BeginNodeEditor();

    // 1. Draw Nodes at engine coordinates
    for (size_t i = 0; i < layout.nodes.size(); ++i) {
        const LayoutNode& node = layout.nodes[i];
        const int drawId = static_cast<int>(i);

        ImNodes::SetNodeGridSpacePos(drawId, ImVec2(node.x, node.y));
        ImNodes::SetNodeDraggable(drawId, false);
        ImNodes::PushColorStyle(ImNodesCol_TitleBar, TitleColor(node));

        ImNodes::BeginNode(drawId);
        ImNodes::BeginNodeTitleBar();
        ImGui::PushTextWrapPos(ImGui::GetCursorPos().x + node.width - 20.0f);
        if (node.level == Level::Domain || node.level == Level::Feature) {
            ImGui::TextUnformatted(node.expanded ? "[-]" : "[+]");
            ImGui::SameLine();
        }
        ImGui::TextUnformatted(node.name.c_str());
        ImGui::PopTextWrapPos();
        ImNodes::EndNodeTitleBar();

        ImNodes::BeginInputAttribute((drawId << 8) + 1);
        ImGui::ProgressBar(node.completion / 100.0f, ImVec2(node.width - 20.0f, 0.0f));
        ImNodes::EndInputAttribute();

        ImNodes::BeginOutputAttribute(drawId << 8);
        if (node.priority) {
            ImGui::TextDisabled("%s", PriorityToString(*node.priority).c_str());
        } else if (node.status) {
            ImGui::TextDisabled("%s", StatusToString(*node.status).c_str());
        } else {
            ImGui::TextDisabled("%d children", node.childCount);
        }
        ImNodes::EndOutputAttribute();

        ImNodes::EndNode();
        ImNodes::PopColorStyle();
    }

    // 2. Draw Edges
    for (size_t i = 0; i < layout.edges.size(); ++i) {
        const LayoutEdge& edge = layout.edges[i];
        int source = state.DrawIdFor(edge.sourceLevel, edge.sourceId);
        int target = state.DrawIdFor(edge.targetLevel, edge.targetId);
        if (source < 0 || target < 0) continue;
        ImNodes::Link(static_cast<int>(i), source << 8, (target << 8) + 1);
    }

    ImNodes::EndNodeEditor();

    // 3. A click selects; a double-click toggles domains and features
    int hovered = -1;
    if (ImNodes::IsNodeHovered(&hovered)) {
        const LayoutNode* node = state.NodeForDrawId(hovered);
        if (node && ImGui::IsMouseClicked(ImGuiMouseButton_Left)) {
            state.selectedId = node->id;
            state.selectedLevel = node->level;
        }
        if (node && ImGui::IsMouseDoubleClicked(ImGuiMouseButton_Left)) {
            Level level = node->level;
            std::string id = node->id; // toggle invalidates the layout
            state.controller->toggle(level, id);
        }
    }
}

void DrawDetailsPanel(ViewerState& state) {
    ProgressSummary summary = state.model.summarize();
    ImGui::Text("Product completion: %d%%", summary.productCompletion);

    ScoreResult score = state.model.computeWeightedScore(state.settings.priorityWeights);
    if (score.ok()) {
        ImGui::Text("Weighted score: %d", score.score);
    } else {
        ImGui::TextColored(ImVec4(0.94f, 0.27f, 0.27f, 1.0f), "Weighted score unavailable: %s",
                           score.error->message.c_str());
    }

    ImGui::Separator();
    DrawLevelSummary("Domains", summary.domains);
    DrawLevelSummary("Features", summary.features);
    DrawLevelSummary("Subtasks", summary.subtasks);
    ImGui::Separator();

    if (state.selectedId.empty()) {
        ImGui::TextDisabled("Click a node to see its details. Double-click a domain or feature to expand it.");
        return;
    }

    const LayoutNode* node = state.controller->layout().find(state.selectedLevel, state.selectedId);
    if (!node) {
        ImGui::TextDisabled("Selected node is hidden by the current filter.");
        return;
    }

    ImGui::Text("%s", node->name.c_str());
    ImGui::TextDisabled("%s '%s'", LevelToString(node->level).c_str(), node->id.c_str());
    ImGui::Text("Completion: %d%%", node->completion);
    if (node->status) ImGui::Text("Status: %s", StatusToString(*node->status).c_str());
    if (node->priority) ImGui::Text("Priority: %s", PriorityToString(*node->priority).c_str());

    if (node->level == Level::Feature) {
        const Feature* feature = state.model.findFeature(node->id);
        if (feature) {
            if (!feature->description.empty()) ImGui::TextWrapped("%s", feature->description.c_str());
            if (!feature->dependencies.empty()) {
                ImGui::Text("Depends on:");
                for (const auto& dep : feature->dependencies) ImGui::BulletText("%s", dep.c_str());
            }
        }
    } else if (node->level == Level::Domain) {
        const Domain* domain = state.model.findDomain(node->id);
        if (domain && !domain->description.empty()) ImGui::TextWrapped("%s", domain->description.c_str());
    } else if (node->level == Level::Product) {
        const std::string& description = state.model.product().description;
        if (!description.empty()) ImGui::TextWrapped("%s", description.c_str());
    }
}

void DrawMainWindow(ViewerState& state) {
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);
    ImGui::Begin("ProgressWalker", nullptr, ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize);

    if (!state.controller) {
        ImGui::TextWrapped("%s", state.statusMessage.c_str());
        if (ImGui::Button("Quit")) state.requestExit = true;
        ImGui::End();
        return;
    }

    DrawFilterToolbar(state);
    ImGui::Separator();

    const float sideWidth = 300.0f;
    ImGui::BeginChild("TreeRegion", ImVec2(-sideWidth, 0), true);
    DrawProgressTree(state);
    ImGui::EndChild();
    ImGui::SameLine();
    ImGui::BeginChild("Details", ImVec2(0, 0), true);
    DrawDetailsPanel(state);
    ImGui::EndChild();

    ImGui::End();
}

} // namespace progresswalker::ui
