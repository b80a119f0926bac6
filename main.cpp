#include <filesystem>
#include <string>

#include "app/ProgressWalkerApp.hpp"

int main(int argc, char** argv) {
    namespace fs = std::filesystem;

    std::string projectRoot = fs::current_path().string();
    std::string documentPath = (fs::path(projectRoot) / "product-structure.json").string();
    if (argc > 1) {
        documentPath = argv[1];
    }

    progresswalker::app::ProgressWalkerApp app;
    return app.Run(projectRoot, documentPath);
}
