/**
 * @file ProductStructureJson.hpp
 * @brief JSON import of the product structure document and JSON export of a layout.
 */

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "application/ProgressUpdate.hpp"
#include "domain/TreeLayout.hpp"

namespace progresswalker::infrastructure {

class ProductStructureJson {
public:
    /**
     * @brief Result of parsing a product structure document.
     */
    struct ImportResult {
        std::vector<application::ProgressUpdate> updates; ///< Product, domains, features, subtasks in document order.
        std::vector<std::string> errors;

        bool ok() const { return errors.empty(); }
    };

    /**
     * @brief Converts `{product, domains[features[subtasks]]}` into an update batch.
     * Missing statuses are derived from completion; unknown enum strings are errors.
     */
    static ImportResult ParseDocument(const std::string& jsonText);

    /**
     * @brief Reads and parses a document from disk.
     */
    static ImportResult LoadFile(const std::string& path);

    /**
     * @brief Serializes the shell-facing layout contract: nodes and edges.
     */
    static nlohmann::json LayoutToJson(const domain::TreeLayout& layout);
};

} // namespace progresswalker::infrastructure
