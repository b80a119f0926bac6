#include <cassert>
#include <iostream>

#include "domain/ProgressModel.hpp"
#include "TestFixtures.hpp"

using namespace progresswalker::domain;

int main() {
    std::cout << "[Test] Starting Query Filter Test..." << std::endl;
    ProgressModel model = progresswalker::test::BuildSampleModel();

    std::cout << "[Test] Matching subtask pulls in its ancestors..." << std::endl;
    {
        ProgressFilter filter;
        filter.status = Status::Complete;
        QueryResult result = model.query(filter);

        assert(result.matchedSubtaskIds == std::set<std::string>{"form"});
        assert(result.matchedFeatureIds.empty());
        assert(result.visibleSubtaskIds == std::set<std::string>{"form"});
        assert(result.visibleFeatureIds == std::set<std::string>{"login"});
        assert(result.visibleDomainIds == std::set<std::string>{"auth"});
        assert(result.isVisible(Level::Product, "walker"));
        assert(!result.isVisible(Level::Feature, "sessions"));
    }

    std::cout << "[Test] Priority filter selects features only..." << std::endl;
    {
        ProgressFilter filter;
        filter.priority = Priority::High;
        QueryResult result = model.query(filter);

        assert(result.matchedFeatureIds == std::set<std::string>{"sessions"});
        assert(result.matchedSubtaskIds.empty());
        assert(result.visibleDomainIds == std::set<std::string>{"auth"});
    }

    std::cout << "[Test] Name pattern is a case-insensitive substring..." << std::endl;
    {
        ProgressFilter filter;
        filter.namePattern = "LOGIN";
        QueryResult result = model.query(filter);
        assert(result.matchedFeatureIds == std::set<std::string>{"login"});
        assert(result.visibleDomainIds == std::set<std::string>{"auth"});
        assert(result.visibleSubtaskIds.empty());

        filter.namePattern = "Check";
        result = model.query(filter);
        assert(result.matchedSubtaskIds == std::set<std::string>{"creds"});
        assert(result.visibleFeatureIds == std::set<std::string>{"login"});

        // A domain matching by name stays visible without any matching child.
        filter.namePattern = "report";
        result = model.query(filter);
        assert(result.visibleDomainIds == std::set<std::string>{"reports"});
        assert(result.visibleFeatureIds.empty());
    }

    std::cout << "[Test] Predicates are conjunctive..." << std::endl;
    {
        ProgressFilter filter;
        filter.status = Status::InProgress;
        filter.priority = Priority::Critical;
        QueryResult result = model.query(filter);
        assert(result.matchedFeatureIds == std::set<std::string>{"login"});
        assert(result.matchedSubtaskIds.empty()); // subtasks carry no priority
        assert(result.visibleSubtaskIds.empty());

        ProgressFilter none;
        none.status = Status::Complete;
        none.namePattern = "credential";
        result = model.query(none);
        assert(result.matchedFeatureIds.empty());
        assert(result.matchedSubtaskIds.empty());
        assert(result.visibleDomainIds.empty());

        // Status predicates never select a domain by itself.
        ProgressFilter pending;
        pending.status = Status::Pending;
        result = model.query(pending);
        assert(result.matchedFeatureIds == std::set<std::string>{"csv"});
        assert(result.visibleDomainIds == std::set<std::string>{"reports"});
    }

    std::cout << "[Test] Empty filters..." << std::endl;
    {
        ProgressFilter filter;
        assert(filter.isEmpty());
        filter.namePattern = "";
        assert(filter.isEmpty());

        QueryResult result = model.query(filter);
        assert(result.visibleDomainIds.size() == 2);
        assert(result.visibleFeatureIds.size() == 3);
        assert(result.visibleSubtaskIds.size() == 2);
    }

    std::cout << "[PASS] Query Filter Test." << std::endl;
    return 0;
}
