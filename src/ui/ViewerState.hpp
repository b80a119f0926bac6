/**
 * @file ViewerState.hpp
 * @brief State of the desktop viewer: model, controller, and UI widgets' buffers.
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>

#include "application/ProgressUpdateService.hpp"
#include "application/ViewStateController.hpp"
#include "domain/ProgressModel.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace progresswalker::ui {

/**
 * @struct FilterInputs
 * @brief Raw widget values of the filter toolbar.
 */
struct FilterInputs {
    int statusIndex = 0;   ///< 0 = all, then pending / in-progress / complete.
    int priorityIndex = 0; ///< 0 = all, then CRITICAL / HIGH / MEDIUM / LOW.
    char search[128] = "";
};

/**
 * @class ViewerState
 * @brief Everything the viewer needs between frames.
 */
class ViewerState {
public:
    ViewerState();
    ~ViewerState();

    /**
     * @brief Loads settings and the product structure document.
     * @param projectRoot Directory holding settings.json.
     * @param documentPath Product structure JSON file.
     * @return False if the document could not be imported.
     */
    bool Load(const std::string& projectRoot, const std::string& documentPath);

    /** @brief Converts the toolbar inputs into a filter and hands it to the controller. */
    void ApplyFilterInputs();

    /** @brief Persists the expand-by-default preference to settings.json. */
    void SetExpandedByDefault(bool expanded);

    /** @brief Writes the current layout to layout.json under the project root. */
    bool ExportLayout();

    /** @brief Maps a drawn node id back to the layout node. */
    const domain::LayoutNode* NodeForDrawId(int drawId) const;
    /** @brief Draw id of a layout node, -1 if it is not in the current layout. */
    int DrawIdFor(domain::Level level, const std::string& id) const;

    void InitImNodes();
    void ShutdownImNodes();

    infrastructure::ViewerSettings settings;
    domain::ProgressModel model;
    std::unique_ptr<application::ProgressUpdateService> updateService;
    std::unique_ptr<application::ViewStateController> controller;

    FilterInputs filterInputs;
    std::string projectRoot;
    std::string statusMessage;
    std::string selectedId;
    domain::Level selectedLevel = domain::Level::Product;
    bool requestExit = false;
    void* graphContext = nullptr;

private:
    void RebuildDrawIndex(const domain::TreeLayout& layout);

    std::map<std::pair<domain::Level, std::string>, int> m_drawIds;
};

} // namespace progresswalker::ui
