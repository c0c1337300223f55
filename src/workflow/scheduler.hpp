#pragma once

#include <workflow/model.hpp>

#include <cstddef>
#include <vector>

/**
 * @brief Resolves the execution order of workflow steps
 *
 * Depth-first topological sort over an index-based adjacency built once from the step list.
 * Every step is placed after all of its transitive dependencies; independent steps keep their
 * declaration order.
 */
class StepScheduler {
public:
    /**
     * @brief Computes a linear execution order
     *
     * @param steps The steps as declared in the workflow
     * @return std::vector<std::size_t> Indices into steps, in execution order
     * @throws DuplicateStepException if two steps share an id
     * @throws DependencyNotFoundException if a dependency does not name a step
     * @throws CycleException if the dependency graph has a cycle
     */
    [[nodiscard]] std::vector<std::size_t> order(std::vector<WorkflowStep> const &steps) const;
};
