/**
 * @file ProgressUpdateService.cpp
 * @brief Implementation of ProgressUpdateService.
 */

#include "application/ProgressUpdateService.hpp"
#include <iostream>

namespace progresswalker::application {

using namespace progresswalker::domain;

namespace {
    bool PayloadMatchesLevel(const ProgressUpdate& update) {
        switch (update.level) {
            case Level::Product: return std::holds_alternative<Product>(update.entity);
            case Level::Domain: return std::holds_alternative<Domain>(update.entity);
            case Level::Feature: return std::holds_alternative<Feature>(update.entity);
            case Level::Subtask: return std::holds_alternative<Subtask>(update.entity);
            default: return false;
        }
    }
}

ProgressUpdateService::ProgressUpdateService(ProgressModel& model) : m_model(model) {}

MutationResult ProgressUpdateService::ApplyTo(ProgressModel& model, const ProgressUpdate& update) {
    if (!PayloadMatchesLevel(update)) {
        return MutationResult::Failure(ErrorCode::InvalidEntity,
            "Payload for '" + update.entityId() + "' does not match level " + LevelToString(update.level));
    }

    switch (update.level) {
        case Level::Product:
            return model.setProduct(std::get<Product>(update.entity));
        case Level::Domain:
            return model.upsertDomain(update.parentId, std::get<Domain>(update.entity));
        case Level::Feature:
            return model.upsertFeature(update.parentId, std::get<Feature>(update.entity));
        case Level::Subtask:
        default:
            return model.upsertSubtask(update.parentId, std::get<Subtask>(update.entity));
    }
}

MutationResult ProgressUpdateService::apply(const ProgressUpdate& update) {
    MutationResult result = ApplyTo(m_model, update);
    if (!result.ok()) {
        std::cerr << "[ProgressUpdateService] Rejected " << LevelToString(update.level)
                  << " '" << update.entityId() << "': " << ErrorCodeToString(result.error->code)
                  << " - " << result.error->message << std::endl;
    }
    return result;
}

ProgressUpdateService::BatchResult ProgressUpdateService::applyBatch(const std::vector<ProgressUpdate>& updates) {
    BatchResult batch;

    // Work on a copy so a late failure cannot leave half a batch behind.
    ProgressModel staged = m_model;
    for (size_t i = 0; i < updates.size(); ++i) {
        MutationResult result = ApplyTo(staged, updates[i]);
        if (!result.ok()) {
            batch.failedIndex = i;
            batch.outcome = result;
            std::cerr << "[ProgressUpdateService] Batch of " << updates.size() << " rejected at #" << i
                      << " (" << updates[i].entityId() << "): " << result.error->message << std::endl;
            return batch;
        }
    }

    m_model = std::move(staged);
    batch.applied = updates.size();
    std::cout << "[ProgressUpdateService] Applied batch of " << updates.size() << " updates." << std::endl;
    return batch;
}

MutationResult ProgressUpdateService::remove(Level level, const std::string& id) {
    MutationResult result;
    switch (level) {
        case Level::Domain: result = m_model.removeDomain(id); break;
        case Level::Feature: result = m_model.removeFeature(id); break;
        case Level::Subtask: result = m_model.removeSubtask(id); break;
        case Level::Product:
        default:
            result = MutationResult::Failure(ErrorCode::InvalidEntity, "The product cannot be removed.");
            break;
    }
    if (!result.ok()) {
        std::cerr << "[ProgressUpdateService] Remove of " << LevelToString(level) << " '" << id
                  << "' rejected: " << result.error->message << std::endl;
    }
    return result;
}

IntegrityReport ProgressUpdateService::checkIntegrity() const {
    IntegrityReport report = DependencyGraph::FromModel(m_model).check();
    for (const auto& d : report.dangling) {
        std::cerr << "[ProgressUpdateService] Feature '" << d.featureId
                  << "' depends on unknown feature '" << d.missingId << "'" << std::endl;
    }
    for (const auto& cycle : report.cycles) {
        std::string chain;
        for (const auto& id : cycle) chain += id + " -> ";
        chain += cycle.front();
        std::cerr << "[ProgressUpdateService] Dependency cycle: " << chain << std::endl;
    }
    return report;
}

} // namespace progresswalker::application
