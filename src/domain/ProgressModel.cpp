#include "domain/ProgressModel.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>

namespace progresswalker::domain {

namespace {
    std::string ToLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    bool ContainsIgnoreCase(const std::string& haystack, const std::string& loweredNeedle) {
        return ToLower(haystack).find(loweredNeedle) != std::string::npos;
    }

    template <typename T>
    int RoundedMean(const std::vector<T>& items) {
        double sum = 0.0;
        for (const auto& item : items) sum += item.completion;
        return static_cast<int>(std::lround(sum / static_cast<double>(items.size())));
    }

    MutationResult CheckCompletion(const std::string& kind, const std::string& id, int completion) {
        if (!IsValidCompletion(completion)) {
            return MutationResult::Failure(ErrorCode::InvalidEntity,
                kind + " '" + id + "' has completion " + std::to_string(completion) + " outside [0,100]");
        }
        return MutationResult::Success();
    }

    MutationResult CheckStatus(const std::string& kind, const std::string& id, int completion, Status status) {
        if (StatusForCompletion(completion) != status) {
            return MutationResult::Failure(ErrorCode::InvalidEntity,
                kind + " '" + id + "' has status " + StatusToString(status) +
                " but completion " + std::to_string(completion));
        }
        return MutationResult::Success();
    }

    LevelSummary CountStatus(const std::vector<Status>& statuses) {
        LevelSummary summary;
        summary.total = static_cast<int>(statuses.size());
        for (Status s : statuses) {
            switch (s) {
                case Status::Complete: summary.complete++; break;
                case Status::InProgress: summary.inProgress++; break;
                case Status::Pending: summary.pending++; break;
            }
        }
        if (summary.total > 0) {
            summary.percentComplete = static_cast<int>(
                std::lround(100.0 * summary.complete / static_cast<double>(summary.total)));
        }
        return summary;
    }
}

// --- Lookup ---

const Domain* ProgressModel::findDomain(const std::string& domainId) const {
    for (const auto& domain : m_product.domains) {
        if (domain.id == domainId) return &domain;
    }
    return nullptr;
}

const Feature* ProgressModel::findFeature(const std::string& featureId) const {
    for (const auto& domain : m_product.domains) {
        for (const auto& feature : domain.features) {
            if (feature.id == featureId) return &feature;
        }
    }
    return nullptr;
}

const Subtask* ProgressModel::findSubtask(const std::string& subtaskId) const {
    for (const auto& domain : m_product.domains) {
        for (const auto& feature : domain.features) {
            for (const auto& subtask : feature.subtasks) {
                if (subtask.id == subtaskId) return &subtask;
            }
        }
    }
    return nullptr;
}

std::string ProgressModel::domainOfFeature(const std::string& featureId) const {
    for (const auto& domain : m_product.domains) {
        for (const auto& feature : domain.features) {
            if (feature.id == featureId) return domain.id;
        }
    }
    return "";
}

std::string ProgressModel::featureOfSubtask(const std::string& subtaskId) const {
    for (const auto& domain : m_product.domains) {
        for (const auto& feature : domain.features) {
            for (const auto& subtask : feature.subtasks) {
                if (subtask.id == subtaskId) return feature.id;
            }
        }
    }
    return "";
}

bool ProgressModel::resolveLevel(const std::string& id, Level& levelOut) const {
    if (!m_product.id.empty() && id == m_product.id) { levelOut = Level::Product; return true; }
    if (findDomain(id)) { levelOut = Level::Domain; return true; }
    if (findFeature(id)) { levelOut = Level::Feature; return true; }
    if (findSubtask(id)) { levelOut = Level::Subtask; return true; }
    return false;
}

Domain* ProgressModel::findDomainMutable(const std::string& domainId) {
    for (auto& domain : m_product.domains) {
        if (domain.id == domainId) return &domain;
    }
    return nullptr;
}

Feature* ProgressModel::findFeatureMutable(const std::string& featureId, Domain** ownerOut) {
    for (auto& domain : m_product.domains) {
        for (auto& feature : domain.features) {
            if (feature.id == featureId) {
                if (ownerOut) *ownerOut = &domain;
                return &feature;
            }
        }
    }
    return nullptr;
}

// --- Validation ---

MutationResult ProgressModel::validateSubtask(const Subtask& subtask) const {
    if (subtask.id.empty()) {
        return MutationResult::Failure(ErrorCode::InvalidEntity, "Subtask id cannot be empty.");
    }
    auto result = CheckCompletion("Subtask", subtask.id, subtask.completion);
    if (!result.ok()) return result;
    return CheckStatus("Subtask", subtask.id, subtask.completion, subtask.status);
}

MutationResult ProgressModel::validateFeature(const Feature& feature, const std::string& domainId) const {
    if (feature.id.empty()) {
        return MutationResult::Failure(ErrorCode::InvalidEntity, "Feature id cannot be empty.");
    }
    auto result = CheckCompletion("Feature", feature.id, feature.completion);
    if (!result.ok()) return result;
    result = CheckStatus("Feature", feature.id, feature.completion, feature.status);
    if (!result.ok()) return result;

    std::string owner = domainOfFeature(feature.id);
    if (!owner.empty() && owner != domainId) {
        return MutationResult::Failure(ErrorCode::InvalidEntity,
            "Feature id '" + feature.id + "' already belongs to domain '" + owner + "'");
    }

    std::set<std::string> seen;
    for (const auto& subtask : feature.subtasks) {
        result = validateSubtask(subtask);
        if (!result.ok()) return result;
        if (!seen.insert(subtask.id).second) {
            return MutationResult::Failure(ErrorCode::InvalidEntity,
                "Subtask id '" + subtask.id + "' repeated in feature '" + feature.id + "'");
        }
    }
    return MutationResult::Success();
}

MutationResult ProgressModel::validateDomain(const Domain& domain) const {
    if (domain.id.empty()) {
        return MutationResult::Failure(ErrorCode::InvalidEntity, "Domain id cannot be empty.");
    }
    auto result = CheckCompletion("Domain", domain.id, domain.completion);
    if (!result.ok()) return result;

    std::set<std::string> featureIds;
    std::set<std::string> subtaskIds;
    for (const auto& feature : domain.features) {
        result = validateFeature(feature, domain.id);
        if (!result.ok()) return result;
        if (!featureIds.insert(feature.id).second) {
            return MutationResult::Failure(ErrorCode::InvalidEntity,
                "Feature id '" + feature.id + "' repeated in domain '" + domain.id + "'");
        }
        for (const auto& subtask : feature.subtasks) {
            if (!subtaskIds.insert(subtask.id).second) {
                return MutationResult::Failure(ErrorCode::InvalidEntity,
                    "Subtask id '" + subtask.id + "' repeated in domain '" + domain.id + "'");
            }
            // Subtasks may change feature only within the domain being replaced.
            std::string owner = featureOfSubtask(subtask.id);
            if (!owner.empty() && domainOfFeature(owner) != domain.id) {
                return MutationResult::Failure(ErrorCode::InvalidEntity,
                    "Subtask id '" + subtask.id + "' already belongs to feature '" + owner + "'");
            }
        }
    }
    return MutationResult::Success();
}

// --- Mutations ---

MutationResult ProgressModel::setProduct(const Product& product) {
    if (product.id.empty()) {
        return MutationResult::Failure(ErrorCode::InvalidEntity, "Product id cannot be empty.");
    }
    auto result = CheckCompletion("Product", product.id, product.completion);
    if (!result.ok()) return result;

    m_product.id = product.id;
    m_product.name = product.name;
    m_product.description = product.description;
    m_product.completion = product.completion;
    recomputeProduct();
    return MutationResult::Success();
}

MutationResult ProgressModel::upsertDomain(const std::string& productId, const Domain& domain) {
    if (m_product.id.empty() || productId != m_product.id) {
        return MutationResult::Failure(ErrorCode::NotFound, "Product not found: " + productId);
    }
    auto result = validateDomain(domain);
    if (!result.ok()) return result;

    Domain* existing = findDomainMutable(domain.id);
    if (!existing) {
        m_product.domains.push_back(domain);
        existing = &m_product.domains.back();
    } else {
        existing->name = domain.name;
        existing->description = domain.description;
        existing->completion = domain.completion;
        if (!domain.features.empty()) existing->features = domain.features;
    }

    for (auto& feature : existing->features) recomputeFeature(feature);
    recomputeDomain(*existing);
    recomputeProduct();
    return MutationResult::Success();
}

MutationResult ProgressModel::upsertFeature(const std::string& domainId, const Feature& feature) {
    Domain* domain = findDomainMutable(domainId);
    if (!domain) {
        return MutationResult::Failure(ErrorCode::NotFound, "Domain not found: " + domainId);
    }
    auto result = validateFeature(feature, domainId);
    if (!result.ok()) return result;
    for (const auto& subtask : feature.subtasks) {
        std::string owner = featureOfSubtask(subtask.id);
        if (!owner.empty() && owner != feature.id) {
            return MutationResult::Failure(ErrorCode::InvalidEntity,
                "Subtask id '" + subtask.id + "' already belongs to feature '" + owner + "'");
        }
    }

    auto it = std::find_if(domain->features.begin(), domain->features.end(),
                           [&](const Feature& f) { return f.id == feature.id; });
    if (it == domain->features.end()) {
        domain->features.push_back(feature);
        it = std::prev(domain->features.end());
    } else {
        std::vector<Subtask> keptSubtasks = std::move(it->subtasks);
        *it = feature;
        if (feature.subtasks.empty()) it->subtasks = std::move(keptSubtasks);
    }

    recomputeFeature(*it);
    recomputeDomain(*domain);
    recomputeProduct();
    return MutationResult::Success();
}

MutationResult ProgressModel::upsertSubtask(const std::string& featureId, const Subtask& subtask) {
    Domain* domain = nullptr;
    Feature* feature = findFeatureMutable(featureId, &domain);
    if (!feature) {
        return MutationResult::Failure(ErrorCode::NotFound, "Feature not found: " + featureId);
    }
    auto result = validateSubtask(subtask);
    if (!result.ok()) return result;

    std::string owner = featureOfSubtask(subtask.id);
    if (!owner.empty() && owner != featureId) {
        return MutationResult::Failure(ErrorCode::InvalidEntity,
            "Subtask id '" + subtask.id + "' already belongs to feature '" + owner + "'");
    }

    auto it = std::find_if(feature->subtasks.begin(), feature->subtasks.end(),
                           [&](const Subtask& s) { return s.id == subtask.id; });
    if (it == feature->subtasks.end()) {
        feature->subtasks.push_back(subtask);
    } else {
        *it = subtask;
    }

    recomputeFeature(*feature);
    recomputeDomain(*domain);
    recomputeProduct();
    return MutationResult::Success();
}

MutationResult ProgressModel::removeDomain(const std::string& domainId) {
    auto it = std::find_if(m_product.domains.begin(), m_product.domains.end(),
                           [&](const Domain& d) { return d.id == domainId; });
    if (it == m_product.domains.end()) {
        return MutationResult::Failure(ErrorCode::NotFound, "Domain not found: " + domainId);
    }
    m_product.domains.erase(it);
    recomputeProduct();
    return MutationResult::Success();
}

MutationResult ProgressModel::removeFeature(const std::string& featureId) {
    for (auto& domain : m_product.domains) {
        auto it = std::find_if(domain.features.begin(), domain.features.end(),
                               [&](const Feature& f) { return f.id == featureId; });
        if (it != domain.features.end()) {
            domain.features.erase(it);
            recomputeDomain(domain);
            recomputeProduct();
            return MutationResult::Success();
        }
    }
    return MutationResult::Failure(ErrorCode::NotFound, "Feature not found: " + featureId);
}

MutationResult ProgressModel::removeSubtask(const std::string& subtaskId) {
    for (auto& domain : m_product.domains) {
        for (auto& feature : domain.features) {
            auto it = std::find_if(feature.subtasks.begin(), feature.subtasks.end(),
                                   [&](const Subtask& s) { return s.id == subtaskId; });
            if (it != feature.subtasks.end()) {
                feature.subtasks.erase(it);
                recomputeFeature(feature);
                recomputeDomain(domain);
                recomputeProduct();
                return MutationResult::Success();
            }
        }
    }
    return MutationResult::Failure(ErrorCode::NotFound, "Subtask not found: " + subtaskId);
}

// --- Recomputation ---

void ProgressModel::recomputeFeature(Feature& feature) {
    if (!feature.subtasks.empty()) {
        feature.completion = RoundedMean(feature.subtasks);
    }
    feature.status = StatusForCompletion(feature.completion);
}

void ProgressModel::recomputeDomain(Domain& domain) {
    // An empty domain keeps its last value rather than dropping to zero.
    if (!domain.features.empty()) {
        domain.completion = RoundedMean(domain.features);
    }
}

void ProgressModel::recomputeProduct() {
    if (!m_product.domains.empty()) {
        m_product.completion = RoundedMean(m_product.domains);
    }
}

void ProgressModel::recomputeAll() {
    for (auto& domain : m_product.domains) {
        for (auto& feature : domain.features) {
            for (auto& subtask : feature.subtasks) {
                subtask.status = StatusForCompletion(subtask.completion);
            }
            recomputeFeature(feature);
        }
        recomputeDomain(domain);
    }
    recomputeProduct();
}

// --- Queries ---

ScoreResult ProgressModel::computeWeightedScore(const PriorityWeights& priorityWeights) const {
    ScoreResult result;

    for (const auto& [priority, weight] : priorityWeights) {
        if (!std::isfinite(weight) || weight < 0.0) {
            result.error = ProgressError{ErrorCode::InvalidWeights,
                "Weight for " + PriorityToString(priority) + " must be a non-negative number"};
            return result;
        }
    }

    double weightedSum = 0.0;
    double weightTotal = 0.0;
    for (const auto& domain : m_product.domains) {
        if (domain.features.empty()) continue;

        Priority highest = domain.features.front().priority;
        for (const auto& feature : domain.features) {
            if (priorityWeights.find(feature.priority) == priorityWeights.end()) {
                result.error = ProgressError{ErrorCode::InvalidWeights,
                    "No weight given for priority " + PriorityToString(feature.priority)};
                return result;
            }
            if (PriorityRank(feature.priority) < PriorityRank(highest)) highest = feature.priority;
        }

        double weight = priorityWeights.at(highest);
        weightedSum += domain.completion * weight;
        weightTotal += weight;
    }

    if (weightTotal > 0.0) {
        result.score = static_cast<int>(std::lround(weightedSum / weightTotal));
    }
    return result;
}

QueryResult ProgressModel::query(const ProgressFilter& filter) const {
    QueryResult result;
    const bool hasPattern = filter.namePattern && !filter.namePattern->empty();
    const std::string pattern = hasPattern ? ToLower(*filter.namePattern) : std::string();

    auto nameMatches = [&](const std::string& name) {
        return !hasPattern || ContainsIgnoreCase(name, pattern);
    };

    for (const auto& domain : m_product.domains) {
        bool domainMatches = !filter.status && !filter.priority && nameMatches(domain.name);
        bool domainHasVisibleChild = false;

        for (const auto& feature : domain.features) {
            bool featureMatches = (!filter.status || feature.status == *filter.status) &&
                                  (!filter.priority || feature.priority == *filter.priority) &&
                                  nameMatches(feature.name);
            bool featureHasMatchingSubtask = false;

            for (const auto& subtask : feature.subtasks) {
                bool subtaskMatches = !filter.priority &&
                                      (!filter.status || subtask.status == *filter.status) &&
                                      nameMatches(subtask.name);
                if (subtaskMatches) {
                    result.matchedSubtaskIds.insert(subtask.id);
                    result.visibleSubtaskIds.insert(subtask.id);
                    featureHasMatchingSubtask = true;
                }
            }

            if (featureMatches) result.matchedFeatureIds.insert(feature.id);
            if (featureMatches || featureHasMatchingSubtask) {
                result.visibleFeatureIds.insert(feature.id);
                domainHasVisibleChild = true;
            }
        }

        if (domainMatches || domainHasVisibleChild) {
            result.visibleDomainIds.insert(domain.id);
        }
    }
    return result;
}

ProgressSummary ProgressModel::summarize() const {
    std::vector<Status> domainStatuses;
    std::vector<Status> featureStatuses;
    std::vector<Status> subtaskStatuses;

    for (const auto& domain : m_product.domains) {
        domainStatuses.push_back(domain.derivedStatus());
        for (const auto& feature : domain.features) {
            featureStatuses.push_back(feature.status);
            for (const auto& subtask : feature.subtasks) {
                subtaskStatuses.push_back(subtask.status);
            }
        }
    }

    ProgressSummary summary;
    summary.productCompletion = m_product.completion;
    summary.domains = CountStatus(domainStatuses);
    summary.features = CountStatus(featureStatuses);
    summary.subtasks = CountStatus(subtaskStatuses);
    return summary;
}

} // namespace progresswalker::domain
