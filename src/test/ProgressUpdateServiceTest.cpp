#include <cassert>
#include <iostream>
#include <vector>

#include "application/ProgressUpdateService.hpp"
#include "TestFixtures.hpp"

using namespace progresswalker::domain;
using namespace progresswalker::application;
using progresswalker::test::DumpTree;

int main() {
    std::cout << "[Test] Starting ProgressUpdateService Test..." << std::endl;

    ProgressModel model;
    ProgressUpdateService service(model);

    std::cout << "[Test] Single updates at every level..." << std::endl;
    assert(service.apply(ProgressUpdate::ForProduct(Product("p", "Product"))).ok());
    assert(service.apply(ProgressUpdate::ForDomain("p", Domain("d", "Domain"))).ok());
    assert(service.apply(ProgressUpdate::ForFeature("d", Feature("f", "Feature", 0, Priority::High))).ok());
    assert(service.apply(ProgressUpdate::ForSubtask("f", Subtask("s", "Subtask", 40))).ok());
    assert(model.findFeature("f")->completion == 40);
    assert(service.model().product().completion == 40);

    std::cout << "[Test] Payload must match the level..." << std::endl;
    {
        ProgressUpdate wrong{Level::Feature, "d", Subtask("x", "X", 10)};
        assert(wrong.entityId() == "x");
        auto r = service.apply(wrong);
        assert(!r.ok() && r.error->code == ErrorCode::InvalidEntity);
        assert(model.findSubtask("x") == nullptr);

        r = service.apply(ProgressUpdate::ForSubtask("ghost", Subtask("x", "X", 10)));
        assert(!r.ok() && r.error->code == ErrorCode::NotFound);
    }

    std::cout << "[Test] Batches are all-or-nothing..." << std::endl;
    {
        const std::string before = DumpTree(model.product());
        std::vector<ProgressUpdate> batch = {
            ProgressUpdate::ForDomain("p", Domain("d2", "Second")),
            ProgressUpdate::ForFeature("d2", Feature("g", "G", 100, Priority::Low)),
            ProgressUpdate::ForSubtask("s", Subtask("y", "Under a subtask", 10)),
        };
        auto result = service.applyBatch(batch);
        assert(!result.ok());
        assert(result.failedIndex == 2);
        assert(result.applied == 0);
        assert(result.outcome.error->code == ErrorCode::NotFound);
        assert(DumpTree(model.product()) == before);
        assert(model.findDomain("d2") == nullptr);

        batch.pop_back();
        result = service.applyBatch(batch);
        assert(result.ok());
        assert(result.applied == 2);
        assert(model.findDomain("d2")->completion == 100);
        assert(model.product().completion == 70);

        assert(service.applyBatch({}).ok());
    }

    std::cout << "[Test] Removal through the service..." << std::endl;
    {
        auto r = service.remove(Level::Product, "p");
        assert(!r.ok() && r.error->code == ErrorCode::InvalidEntity);
        r = service.remove(Level::Subtask, "ghost");
        assert(!r.ok() && r.error->code == ErrorCode::NotFound);

        assert(service.remove(Level::Subtask, "s").ok());
        assert(model.findFeature("f")->subtasks.empty());
        assert(service.remove(Level::Feature, "g").ok());
        assert(service.remove(Level::Domain, "d2").ok());
        assert(model.product().completion == 40);
    }

    std::cout << "[Test] Integrity check..." << std::endl;
    {
        assert(service.checkIntegrity().isClean());

        Feature loop("f", "Feature", 40, Priority::High);
        loop.dependencies = {"f"};
        assert(service.apply(ProgressUpdate::ForFeature("d", loop)).ok());
        IntegrityReport report = service.checkIntegrity();
        assert(report.cycles.size() == 1);
        assert(report.dangling.empty());
    }

    std::cout << "[PASS] ProgressUpdateService Test." << std::endl;
    return 0;
}
