#pragma once

#include "ui/ViewerState.hpp"

namespace progresswalker::ui {

// Components
void DrawFilterToolbar(ViewerState& state);
void DrawProgressTree(ViewerState& state);
void DrawDetailsPanel(ViewerState& state);

// Main Blocks
void DrawMainWindow(ViewerState& state);

} // namespace progresswalker::ui
