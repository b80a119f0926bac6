#include "ui/ViewerState.hpp"
#include "infrastructure/ProductStructureJson.hpp"
#include "imnodes.h"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace progresswalker::ui {

using namespace progresswalker::domain;

ViewerState::ViewerState() {
    updateService = std::make_unique<application::ProgressUpdateService>(model);
}

ViewerState::~ViewerState() {
    ShutdownImNodes();
}

bool ViewerState::Load(const std::string& root, const std::string& documentPath) {
    projectRoot = root;
    settings = infrastructure::ConfigLoader::Load(root);

    auto imported = infrastructure::ProductStructureJson::LoadFile(documentPath);
    if (!imported.ok()) {
        statusMessage = "Import failed: " + imported.errors.front();
        std::cerr << "[ViewerState] " << statusMessage << std::endl;
        return false;
    }

    auto batch = updateService->applyBatch(imported.updates);
    if (!batch.ok()) {
        statusMessage = "Rejected update #" + std::to_string(batch.failedIndex) + ": " + batch.outcome.error->message;
        return false;
    }

    updateService->checkIntegrity();

    controller = std::make_unique<application::ViewStateController>(model, settings.layout, settings.expandedByDefault);
    controller->setListener([this](const TreeLayout& layout) { RebuildDrawIndex(layout); });
    RebuildDrawIndex(controller->layout());

    statusMessage = "Loaded " + std::to_string(batch.applied) + " entities from " + documentPath;
    std::cout << "[ViewerState] " << statusMessage << std::endl;
    return true;
}

void ViewerState::ApplyFilterInputs() {
    if (!controller) return;

    ProgressFilter filter;
    if (filterInputs.statusIndex > 0) {
        static const Status kStatuses[] = {Status::Pending, Status::InProgress, Status::Complete};
        filter.status = kStatuses[filterInputs.statusIndex - 1];
    }
    if (filterInputs.priorityIndex > 0) {
        static const Priority kPriorities[] = {Priority::Critical, Priority::High, Priority::Medium, Priority::Low};
        filter.priority = kPriorities[filterInputs.priorityIndex - 1];
    }
    if (filterInputs.search[0] != '\0') {
        filter.namePattern = std::string(filterInputs.search);
    }
    controller->setFilter(filter);
}

void ViewerState::SetExpandedByDefault(bool expanded) {
    settings.expandedByDefault = expanded;
    infrastructure::ConfigLoader::SaveExpandedByDefault(projectRoot, expanded);
}

bool ViewerState::ExportLayout() {
    if (!controller) return false;
    std::filesystem::path target = std::filesystem::path(projectRoot) / "layout.json";
    std::ofstream out(target);
    if (!out) {
        statusMessage = "Cannot write " + target.string();
        std::cerr << "[ViewerState] " << statusMessage << std::endl;
        return false;
    }
    out << infrastructure::ProductStructureJson::LayoutToJson(controller->layout()).dump(4);
    statusMessage = "Layout exported to " + target.string();
    std::cout << "[ViewerState] " << statusMessage << std::endl;
    return true;
}

void ViewerState::RebuildDrawIndex(const TreeLayout& layout) {
    m_drawIds.clear();
    for (size_t i = 0; i < layout.nodes.size(); ++i) {
        m_drawIds[{layout.nodes[i].level, layout.nodes[i].id}] = static_cast<int>(i);
    }
}

const LayoutNode* ViewerState::NodeForDrawId(int drawId) const {
    if (!controller) return nullptr;
    const auto& nodes = controller->layout().nodes;
    if (drawId < 0 || static_cast<size_t>(drawId) >= nodes.size()) return nullptr;
    return &nodes[static_cast<size_t>(drawId)];
}

int ViewerState::DrawIdFor(Level level, const std::string& id) const {
    auto it = m_drawIds.find({level, id});
    return it == m_drawIds.end() ? -1 : it->second;
}

void ViewerState::InitImNodes() {
    if (!graphContext) {
        graphContext = ImNodes::EditorContextCreate();
    }
}

void ViewerState::ShutdownImNodes() {
    if (graphContext) {
        ImNodes::EditorContextFree(static_cast<ImNodesEditorContext*>(graphContext));
        graphContext = nullptr;
    }
}

} // namespace progresswalker::ui
