#include "domain/DependencyGraph.hpp"
#include <algorithm>
#include <functional>

namespace progresswalker::domain {

DependencyGraph DependencyGraph::FromModel(const ProgressModel& model) {
    DependencyGraph graph;
    for (const auto& domain : model.product().domains) {
        for (const auto& feature : domain.features) {
            graph.addFeature(feature.id);
            for (const auto& dep : feature.dependencies) {
                graph.addDependency(feature.id, dep);
            }
        }
    }
    return graph;
}

void DependencyGraph::addFeature(const std::string& featureId) {
    m_adjacency.emplace(featureId, std::vector<std::string>{});
}

void DependencyGraph::addDependency(const std::string& featureId, const std::string& dependsOnId) {
    auto& deps = m_adjacency[featureId];
    if (std::find(deps.begin(), deps.end(), dependsOnId) == deps.end()) {
        deps.push_back(dependsOnId);
    }
}

const std::vector<std::string>& DependencyGraph::dependenciesOf(const std::string& featureId) const {
    static const std::vector<std::string> kNone;
    auto it = m_adjacency.find(featureId);
    return it == m_adjacency.end() ? kNone : it->second;
}

std::vector<std::string> DependencyGraph::dependentsOf(const std::string& featureId) const {
    std::vector<std::string> dependents;
    for (const auto& [id, deps] : m_adjacency) {
        if (std::find(deps.begin(), deps.end(), featureId) != deps.end()) {
            dependents.push_back(id);
        }
    }
    return dependents;
}

std::vector<DanglingDependency> DependencyGraph::findDangling() const {
    std::vector<DanglingDependency> dangling;
    for (const auto& [id, deps] : m_adjacency) {
        for (const auto& dep : deps) {
            if (m_adjacency.find(dep) == m_adjacency.end()) {
                dangling.push_back({id, dep});
            }
        }
    }
    return dangling;
}

std::vector<std::vector<std::string>> DependencyGraph::findCycles() const {
    enum class Mark { White, Grey, Black };
    std::map<std::string, Mark> marks;
    for (const auto& entry : m_adjacency) marks[entry.first] = Mark::White;

    std::vector<std::vector<std::string>> cycles;
    std::vector<std::string> path;

    std::function<void(const std::string&)> Visit = [&](const std::string& u) {
        marks[u] = Mark::Grey;
        path.push_back(u);
        for (const auto& v : dependenciesOf(u)) {
            auto mark = marks.find(v);
            if (mark == marks.end()) continue; // dangling, reported separately
            if (mark->second == Mark::Grey) {
                auto start = std::find(path.begin(), path.end(), v);
                cycles.emplace_back(start, path.end());
            } else if (mark->second == Mark::White) {
                Visit(v);
            }
        }
        path.pop_back();
        marks[u] = Mark::Black;
    };

    for (const auto& entry : m_adjacency) {
        if (marks[entry.first] == Mark::White) Visit(entry.first);
    }
    return cycles;
}

IntegrityReport DependencyGraph::check() const {
    IntegrityReport report;
    report.dangling = findDangling();
    report.cycles = findCycles();
    return report;
}

} // namespace progresswalker::domain
