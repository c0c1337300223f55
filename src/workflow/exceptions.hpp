#pragma once

#include <workflow/model.hpp>

#include <stdexcept>
#include <string>
#include <utility>

struct WorkflowException : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// the definition file is missing, unreadable or malformed
struct WorkflowDefinitionException : public WorkflowException {
    WorkflowDefinitionException(std::string const &path, std::string const &reason)
        : WorkflowException{ "Invalid workflow definition '" + path + "': " + reason }
        , path{ path }
        , reason{ reason } { }

    std::string path;
    std::string reason;
};

struct GraphException : public WorkflowException {
    GraphException(std::string const &message, std::string const &step_id)
        : WorkflowException{ message }
        , step_id{ step_id } { }

    std::string step_id;
};

struct DependencyNotFoundException : public GraphException {
    explicit DependencyNotFoundException(std::string const &step_id, std::string const &dependency)
        : GraphException{ "Dependency step not found: " + dependency + " (required by " + step_id + ")", step_id }
        , dependency{ dependency } { }

    std::string dependency;
};

struct CycleException : public GraphException {
    explicit CycleException(std::string const &step_id)
        : GraphException{ "Circular dependency detected for step: " + step_id, step_id } { }
};

struct DuplicateStepException : public GraphException {
    explicit DuplicateStepException(std::string const &step_id)
        : GraphException{ "Duplicate step id: " + step_id, step_id } { }
};

/**
 * @brief A step failed after exhausting its retries
 *
 * Carries the execution record as it was persisted, including the partial step history.
 */
struct StepFailedException : public WorkflowException {
    StepFailedException(std::string const &step_id, std::string const &error, WorkflowExecution execution)
        : WorkflowException{ "Step " + step_id + " failed: " + error }
        , step_id{ step_id }
        , execution{ std::move(execution) } { }

    std::string step_id;
    WorkflowExecution execution;
};
