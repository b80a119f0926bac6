/**
 * @file ProgressUpdate.hpp
 * @brief Input contract of the progress source: one upsert of {level, parentId, entity}.
 */

#pragma once

#include <string>
#include <utility>
#include <variant>
#include "domain/ProgressEntities.hpp"

namespace progresswalker::application {

using EntityPayload = std::variant<domain::Product, domain::Domain, domain::Feature, domain::Subtask>;

/**
 * @struct ProgressUpdate
 * @brief A single upsert delivered by the progress source.
 *
 * parentId is ignored for the product, the product id for a domain, the
 * domain id for a feature and the feature id for a subtask.
 */
struct ProgressUpdate {
    domain::Level level = domain::Level::Subtask;
    std::string parentId;
    EntityPayload entity;

    static ProgressUpdate ForProduct(domain::Product product) {
        return {domain::Level::Product, "", std::move(product)};
    }
    static ProgressUpdate ForDomain(std::string productId, domain::Domain payload) {
        return {domain::Level::Domain, std::move(productId), std::move(payload)};
    }
    static ProgressUpdate ForFeature(std::string domainId, domain::Feature feature) {
        return {domain::Level::Feature, std::move(domainId), std::move(feature)};
    }
    static ProgressUpdate ForSubtask(std::string featureId, domain::Subtask subtask) {
        return {domain::Level::Subtask, std::move(featureId), std::move(subtask)};
    }

    /** @brief Id of the carried entity. */
    const std::string& entityId() const {
        return std::visit([](const auto& e) -> const std::string& { return e.id; }, entity);
    }
};

} // namespace progresswalker::application
