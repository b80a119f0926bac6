#include <cassert>
#include <iostream>
#include <limits>

#include "domain/ProgressModel.hpp"
#include "TestFixtures.hpp"

using namespace progresswalker::domain;

namespace {

PriorityWeights DefaultWeights() {
    return {{Priority::Critical, 1.5}, {Priority::High, 1.2}, {Priority::Medium, 1.0}, {Priority::Low, 0.5}};
}

} // namespace

int main() {
    std::cout << "[Test] Starting Weighted Score Test..." << std::endl;

    // Single domain weighted by its highest-priority feature.
    {
        ProgressModel model;
        assert(model.setProduct(Product("p", "Product")).ok());
        assert(model.upsertDomain("p", Domain("d", "Domain")).ok());
        assert(model.upsertFeature("d", Feature("a", "A", 70, Priority::High)).ok());
        assert(model.upsertFeature("d", Feature("b", "B", 90, Priority::Low)).ok());
        assert(model.findDomain("d")->completion == 80);

        ScoreResult result = model.computeWeightedScore(DefaultWeights());
        assert(result.ok());
        assert(result.score == 80);
    }

    // Two domains: CRITICAL at 100 (x1.5) and LOW at 0 (x0.5) -> 150 / 2.0.
    {
        ProgressModel model;
        assert(model.setProduct(Product("p", "Product")).ok());
        assert(model.upsertDomain("p", Domain("hot", "Hot")).ok());
        assert(model.upsertDomain("p", Domain("cold", "Cold")).ok());
        assert(model.upsertFeature("hot", Feature("h", "H", 100, Priority::Critical)).ok());
        assert(model.upsertFeature("cold", Feature("c", "C", 0, Priority::Low)).ok());

        ScoreResult result = model.computeWeightedScore(DefaultWeights());
        assert(result.ok() && result.score == 75);

        // A domain without features carries no priority and is skipped.
        assert(model.upsertDomain("p", Domain("empty", "Empty", 10)).ok());
        result = model.computeWeightedScore(DefaultWeights());
        assert(result.ok() && result.score == 75);

        // Weights for priorities absent from the tree may be omitted.
        PriorityWeights partial = {{Priority::Critical, 3.0}, {Priority::Low, 1.0}};
        result = model.computeWeightedScore(partial);
        assert(result.ok() && result.score == 75);

        // Zero total weight scores zero rather than dividing by zero.
        PriorityWeights zeros = {{Priority::Critical, 0.0}, {Priority::Low, 0.0}};
        result = model.computeWeightedScore(zeros);
        assert(result.ok() && result.score == 0);
    }

    // Malformed weight maps.
    {
        ProgressModel model = progresswalker::test::BuildSampleModel();

        PriorityWeights negative = DefaultWeights();
        negative[Priority::Medium] = -0.1;
        ScoreResult result = model.computeWeightedScore(negative);
        assert(!result.ok() && result.error->code == ErrorCode::InvalidWeights);

        PriorityWeights missingLow = DefaultWeights();
        missingLow.erase(Priority::Low);
        result = model.computeWeightedScore(missingLow);
        assert(!result.ok() && result.error->code == ErrorCode::InvalidWeights);

        // HIGH is used by 'sessions' even though 'auth' is weighted as CRITICAL.
        PriorityWeights missingHigh = DefaultWeights();
        missingHigh.erase(Priority::High);
        result = model.computeWeightedScore(missingHigh);
        assert(!result.ok() && result.error->code == ErrorCode::InvalidWeights);

        PriorityWeights notANumber = DefaultWeights();
        notANumber[Priority::Critical] = std::numeric_limits<double>::quiet_NaN();
        result = model.computeWeightedScore(notANumber);
        assert(!result.ok() && result.error->code == ErrorCode::InvalidWeights);

        // auth 48 x1.5 + reports 0 x0.5 = 72 / 2.0
        result = model.computeWeightedScore(DefaultWeights());
        assert(result.ok() && result.score == 36);
    }

    // An empty model scores zero.
    {
        ProgressModel model;
        ScoreResult result = model.computeWeightedScore(DefaultWeights());
        assert(result.ok() && result.score == 0);
    }

    std::cout << "[PASS] Weighted Score Test." << std::endl;
    return 0;
}
