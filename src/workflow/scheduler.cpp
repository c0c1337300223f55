#include <workflow/exceptions.hpp>
#include <workflow/scheduler.hpp>

#include <string>
#include <unordered_map>
#include <utility>

namespace {

enum class Mark {
    UNVISITED,
    VISITING,
    VISITED
};

using adjacency_t = std::vector<std::vector<std::size_t>>;

adjacency_t build_adjacency(std::vector<WorkflowStep> const &steps) {
    std::unordered_map<std::string, std::size_t> index_of;
    for(std::size_t i = 0; i < steps.size(); ++i) {
        if(not index_of.emplace(steps[i].id, i).second)
            throw DuplicateStepException{ steps[i].id };
    }

    adjacency_t deps(steps.size());
    for(std::size_t i = 0; i < steps.size(); ++i) {
        for(auto const &dep_id : steps[i].depends_on) {
            auto it = index_of.find(dep_id);
            if(it == std::end(index_of))
                throw DependencyNotFoundException{ steps[i].id, dep_id };
            deps[i].push_back(it->second);
        }
    }
    return deps;
}

} // namespace

std::vector<std::size_t> StepScheduler::order(std::vector<WorkflowStep> const &steps) const {
    auto const deps = build_adjacency(steps);

    std::vector<Mark> marks(steps.size(), Mark::UNVISITED);
    std::vector<std::size_t> sorted;
    sorted.reserve(steps.size());

    // explicit stack of (step, next dependency to visit) instead of recursion
    std::vector<std::pair<std::size_t, std::size_t>> stack;

    for(std::size_t root = 0; root < steps.size(); ++root) {
        if(marks[root] != Mark::UNVISITED)
            continue;

        marks[root] = Mark::VISITING;
        stack.emplace_back(root, 0);

        while(not stack.empty()) {
            auto &[current, next] = stack.back();

            if(next == deps[current].size()) {
                marks[current] = Mark::VISITED;
                sorted.push_back(current);
                stack.pop_back();
                continue;
            }

            auto const dep = deps[current][next++];
            switch(marks[dep]) {
            case Mark::VISITING:
                throw CycleException{ steps[dep].id };
            case Mark::VISITED:
                break;
            case Mark::UNVISITED:
                marks[dep] = Mark::VISITING;
                stack.emplace_back(dep, 0); // invalidates current/next
                break;
            }
        }
    }

    return sorted;
}
