/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace progresswalker::infrastructure {

using json = nlohmann::json;
using namespace progresswalker::domain;

namespace {
    void ReadFloat(const json& j, const char* key, float& target) {
        if (j.contains(key) && j[key].is_number()) {
            target = j[key].get<float>();
        }
    }

    void ReadFootprint(const json& footprints, const char* key, NodeFootprint& target) {
        if (!footprints.contains(key) || !footprints[key].is_object()) return;
        ReadFloat(footprints[key], "width", target.width);
        ReadFloat(footprints[key], "height", target.height);
    }
}

ViewerSettings::ViewerSettings()
    : priorityWeights{{Priority::Critical, 1.5}, {Priority::High, 1.2},
                      {Priority::Medium, 1.0}, {Priority::Low, 0.5}} {}

std::optional<ViewerSettings> ConfigLoader::Parse(const std::string& jsonText) {
    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        std::cerr << "[ConfigLoader] Error parsing settings: " << e.what() << std::endl;
        return std::nullopt;
    }

    ViewerSettings settings;
    if (!j.is_object()) return settings;

    if (j.contains("layout") && j["layout"].is_object()) {
        const json& layout = j["layout"];
        LayoutConfig candidate = settings.layout;
        ReadFloat(layout, "horizontal_spacing", candidate.horizontalSpacing);
        ReadFloat(layout, "vertical_spacing", candidate.verticalSpacing);
        if (layout.contains("footprints") && layout["footprints"].is_object()) {
            const json& fp = layout["footprints"];
            ReadFootprint(fp, "product", candidate.product);
            ReadFootprint(fp, "domain", candidate.domain);
            ReadFootprint(fp, "feature", candidate.feature);
            ReadFootprint(fp, "subtask", candidate.subtask);
        }
        if (candidate.isValid()) {
            settings.layout = candidate;
        } else {
            std::cerr << "[ConfigLoader] Ignoring layout block: footprints must shrink from product to subtask." << std::endl;
        }
    }

    if (j.contains("priority_weights") && j["priority_weights"].is_object()) {
        for (const auto& [key, value] : j["priority_weights"].items()) {
            auto priority = ParsePriority(key);
            if (!priority || !value.is_number()) {
                std::cerr << "[ConfigLoader] Ignoring priority weight '" << key << "'" << std::endl;
                continue;
            }
            // Negative weights are kept so computeWeightedScore can report them.
            settings.priorityWeights[*priority] = value.get<double>();
        }
    }

    if (j.contains("expanded_by_default") && j["expanded_by_default"].is_boolean()) {
        settings.expandedByDefault = j["expanded_by_default"].get<bool>();
    }

    return settings;
}

ViewerSettings ConfigLoader::Load(const std::string& projectRoot) {
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    if (!std::filesystem::exists(configPath)) {
        return ViewerSettings{};
    }

    std::ifstream f(configPath);
    if (!f) {
        std::cerr << "[ConfigLoader] Cannot open " << configPath << std::endl;
        return ViewerSettings{};
    }
    std::stringstream buffer;
    buffer << f.rdbuf();

    auto parsed = Parse(buffer.str());
    return parsed ? *parsed : ViewerSettings{};
}

void ConfigLoader::SaveExpandedByDefault(const std::string& projectRoot, bool expanded) {
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    json j = json::object();

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        std::ifstream f(configPath);
        json existing = json::parse(f, nullptr, false);
        if (!existing.is_discarded() && existing.is_object()) {
            j = existing;
        } else {
            std::cerr << "[ConfigLoader] settings.json is malformed; rewriting it." << std::endl;
        }
    }

    j["expanded_by_default"] = expanded;

    std::ofstream f(configPath);
    if (!f) {
        std::cerr << "[ConfigLoader] Error writing settings.json at " << configPath << std::endl;
        return;
    }
    f << j.dump(4);
}

} // namespace progresswalker::infrastructure
