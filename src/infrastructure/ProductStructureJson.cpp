/**
 * @file ProductStructureJson.cpp
 * @brief Implementation of ProductStructureJson.
 */

#include "infrastructure/ProductStructureJson.hpp"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>

namespace progresswalker::infrastructure {

using json = nlohmann::json;
using namespace progresswalker::domain;
using application::ProgressUpdate;

namespace {
    std::string ReadString(const json& j, const char* key) {
        if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
        return "";
    }

    // Completion must be a JSON integer in [0, 100]. Anything else is reported, never rounded or wrapped.
    int ReadCompletion(const json& j, const std::string& where, std::vector<std::string>& errors) {
        if (!j.contains("completion")) return 0;
        const json& value = j["completion"];
        if (value.is_number_unsigned()) {
            std::uint64_t raw = value.get<std::uint64_t>();
            if (raw <= static_cast<std::uint64_t>(kMaxCompletion)) return static_cast<int>(raw);
        } else if (value.is_number_integer()) {
            std::int64_t raw = value.get<std::int64_t>();
            if (raw >= kMinCompletion && raw <= kMaxCompletion) return static_cast<int>(raw);
        }
        errors.push_back(where + ": completion must be an integer in [0,100], got " + value.dump());
        return 0;
    }

    Status ReadStatus(const json& j, int completion, const std::string& where, std::vector<std::string>& errors) {
        std::string text = ReadString(j, "status");
        if (text.empty()) return StatusForCompletion(completion);
        auto status = ParseStatus(text);
        if (!status) {
            errors.push_back(where + ": unknown status '" + text + "'");
            return StatusForCompletion(completion);
        }
        return *status;
    }
}

ProductStructureJson::ImportResult ProductStructureJson::ParseDocument(const std::string& jsonText) {
    ImportResult result;
    json doc;
    try {
        doc = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        result.errors.push_back(std::string("Invalid JSON: ") + e.what());
        return result;
    }

    if (!doc.is_object() || !doc.contains("product") || !doc["product"].is_object()) {
        result.errors.push_back("Document has no 'product' object.");
        return result;
    }

    const json& productJson = doc["product"];
    const std::string productWhere = "product '" + ReadString(productJson, "id") + "'";
    Product product(ReadString(productJson, "id"), ReadString(productJson, "name"),
                    ReadCompletion(productJson, productWhere, result.errors));
    product.description = ReadString(productJson, "description");
    const std::string productId = product.id;
    result.updates.push_back(ProgressUpdate::ForProduct(std::move(product)));

    if (!doc.contains("domains")) return result;
    if (!doc["domains"].is_array()) {
        result.errors.push_back("'domains' must be an array.");
        return result;
    }

    for (const auto& domainJson : doc["domains"]) {
        const std::string domainWhere = "domain '" + ReadString(domainJson, "id") + "'";
        Domain domain(ReadString(domainJson, "id"), ReadString(domainJson, "name"),
                      ReadCompletion(domainJson, domainWhere, result.errors));
        domain.description = ReadString(domainJson, "description");
        const std::string domainId = domain.id;
        result.updates.push_back(ProgressUpdate::ForDomain(productId, std::move(domain)));

        if (!domainJson.contains("features") || !domainJson["features"].is_array()) continue;

        for (const auto& featureJson : domainJson["features"]) {
            Feature feature;
            feature.id = ReadString(featureJson, "id");
            feature.name = ReadString(featureJson, "name");
            feature.description = ReadString(featureJson, "description");
            feature.completion = ReadCompletion(featureJson, "feature '" + feature.id + "'", result.errors);
            feature.status = ReadStatus(featureJson, feature.completion, "feature '" + feature.id + "'", result.errors);

            std::string priorityText = ReadString(featureJson, "priority");
            if (!priorityText.empty()) {
                auto priority = ParsePriority(priorityText);
                if (priority) {
                    feature.priority = *priority;
                } else {
                    result.errors.push_back("feature '" + feature.id + "': unknown priority '" + priorityText + "'");
                }
            }

            if (featureJson.contains("dependencies") && featureJson["dependencies"].is_array()) {
                for (const auto& dep : featureJson["dependencies"]) {
                    if (dep.is_string()) feature.dependencies.push_back(dep.get<std::string>());
                }
            }

            const std::string featureId = feature.id;
            result.updates.push_back(ProgressUpdate::ForFeature(domainId, std::move(feature)));

            if (!featureJson.contains("subtasks") || !featureJson["subtasks"].is_array()) continue;

            for (const auto& subtaskJson : featureJson["subtasks"]) {
                const std::string subtaskWhere = "subtask '" + ReadString(subtaskJson, "id") + "'";
                Subtask subtask(ReadString(subtaskJson, "id"), ReadString(subtaskJson, "name"),
                                ReadCompletion(subtaskJson, subtaskWhere, result.errors));
                subtask.status = ReadStatus(subtaskJson, subtask.completion, subtaskWhere, result.errors);
                result.updates.push_back(ProgressUpdate::ForSubtask(featureId, std::move(subtask)));
            }
        }
    }
    return result;
}

ProductStructureJson::ImportResult ProductStructureJson::LoadFile(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        ImportResult result;
        result.errors.push_back("Cannot open " + path);
        std::cerr << "[ProductStructureJson] Cannot open " << path << std::endl;
        return result;
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return ParseDocument(buffer.str());
}

json ProductStructureJson::LayoutToJson(const TreeLayout& layout) {
    json nodes = json::array();
    for (const auto& node : layout.nodes) {
        json n = {
            {"id", node.id},
            {"level", LevelToString(node.level)},
            {"x", node.x},
            {"y", node.y},
            {"width", node.width},
            {"height", node.height},
            {"completion", node.completion}
        };
        if (node.status) n["status"] = StatusToString(*node.status);
        if (node.priority) n["priority"] = PriorityToString(*node.priority);
        nodes.push_back(n);
    }

    json edges = json::array();
    for (const auto& edge : layout.edges) {
        edges.push_back({{"sourceId", edge.sourceId}, {"targetId", edge.targetId}});
    }

    return {{"nodes", nodes}, {"edges", edges}};
}

} // namespace progresswalker::infrastructure
