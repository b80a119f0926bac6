/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving viewer and layout configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place: layout spacing and footprints,
 * priority weights for scoring, and the default expansion state.
 */

#pragma once

#include <string>
#include <optional>

#include "domain/ProgressModel.hpp"
#include "domain/TreeLayout.hpp"

namespace progresswalker::infrastructure {

/**
 * @struct ViewerSettings
 * @brief Everything settings.json can configure, with built-in defaults.
 */
struct ViewerSettings {
    domain::LayoutConfig layout;
    domain::PriorityWeights priorityWeights;
    bool expandedByDefault = false;

    ViewerSettings();
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from the project root.
     * Missing files, missing keys and malformed values fall back to defaults.
     */
    static ViewerSettings Load(const std::string& projectRoot);

    /**
     * @brief Parses settings from a JSON string.
     * @return Parsed settings, or std::nullopt if the text is not valid JSON.
     */
    static std::optional<ViewerSettings> Parse(const std::string& jsonText);

    /**
     * @brief Saves the 'expanded_by_default' key to settings.json, preserving other keys if possible.
     */
    static void SaveExpandedByDefault(const std::string& projectRoot, bool expanded);
};

} // namespace progresswalker::infrastructure
