/**
 * @file ProgressWalkerApp.hpp
 * @brief Main application class for the ProgressWalker viewer.
 */

#pragma once

#include <string>

#include "ui/ViewerState.hpp"

struct SDL_Window;

namespace progresswalker::app {

/**
 * @class ProgressWalkerApp
 * @brief Orchestrates the viewer lifecycle: initialization, the main loop, and shutdown.
 */
class ProgressWalkerApp {
public:
    /**
     * @brief Loads the document and runs the main loop.
     * @param projectRoot Directory holding settings.json.
     * @param documentPath Product structure JSON file.
     * @return Exit code (0 for success).
     */
    int Run(const std::string& projectRoot, const std::string& documentPath);

private:
    bool Init(const std::string& projectRoot, const std::string& documentPath);
    void Shutdown();

    ui::ViewerState m_state;
    SDL_Window* m_window = nullptr; ///< SDL window handle.
    void* m_glContext = nullptr; ///< OpenGL context.
    bool m_sdlInitialized = false;
    bool m_imguiInitialized = false;
};

} // namespace progresswalker::app
