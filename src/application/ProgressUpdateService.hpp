/**
 * @file ProgressUpdateService.hpp
 * @brief Entry point for the progress source: upserts, removals and integrity checks.
 */

#pragma once

#include <string>
#include <vector>

#include "application/ProgressUpdate.hpp"
#include "domain/DependencyGraph.hpp"
#include "domain/ProgressModel.hpp"

namespace progresswalker::application {

/**
 * @class ProgressUpdateService
 * @brief Routes collaborator updates to the ProgressModel and logs rejections.
 */
class ProgressUpdateService {
public:
    /**
     * @brief Result of a batch application.
     */
    struct BatchResult {
        size_t applied = 0;        ///< Updates applied (0 when the batch was rejected).
        size_t failedIndex = 0;    ///< Index of the first failing update, if any.
        domain::MutationResult outcome;

        bool ok() const { return outcome.ok(); }
    };

    explicit ProgressUpdateService(domain::ProgressModel& model);

    /**
     * @brief Applies one upsert.
     * @return InvalidEntity if the payload type does not match the level.
     */
    domain::MutationResult apply(const ProgressUpdate& update);

    /**
     * @brief Applies a batch atomically: either every update lands or none.
     */
    BatchResult applyBatch(const std::vector<ProgressUpdate>& updates);

    /**
     * @brief Removes an entity and recomputes its ancestors.
     * @return NotFound for unknown ids; removing the product is rejected as InvalidEntity.
     */
    domain::MutationResult remove(domain::Level level, const std::string& id);

    /**
     * @brief Runs the optional dependency integrity check and logs its findings.
     */
    domain::IntegrityReport checkIntegrity() const;

    const domain::ProgressModel& model() const { return m_model; }

private:
    static domain::MutationResult ApplyTo(domain::ProgressModel& model, const ProgressUpdate& update);

    domain::ProgressModel& m_model;
};

} // namespace progresswalker::application
