#pragma once

#include <config/config.hpp>
#include <process/concepts.hpp>
#include <reporting/events.hpp>
#include <util/uuid.hpp>
#include <workflow/exceptions.hpp>
#include <workflow/impl/execution_store.hpp>
#include <workflow/impl/yaml_definition_loader.hpp>
#include <workflow/model.hpp>
#include <workflow/scheduler.hpp>
#include <workflow/step_executor.hpp>

#include <di.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Loads workflow definitions and runs them to completion
 *
 * Steps run strictly one after another in the order resolved by the StepScheduler.
 * The first step that fails after exhausting its retries aborts the run (fail-fast);
 * the execution record is persisted either way, graph and definition errors excepted.
 */
template <CommandRunner ProcessRunnerType, BackoffSleeper SleeperType, typename ReportEngineType>
class WorkflowEngine {
    using process_runner_t = ProcessRunnerType;
    using sleeper_t        = SleeperType;
    using reporting_t      = ReportEngineType;
    using step_executor_t  = StepExecutor<process_runner_t, sleeper_t, reporting_t>;

public:
    using services_t = di::Deps<reporting_t, process_runner_t, sleeper_t>;

private:
    services_t services_;
    WorkflowConfig config_;
    impl::YamlDefinitionLoader loader_;
    impl::ExecutionStore store_;
    StepScheduler scheduler_;

public:
    WorkflowEngine(services_t services, WorkflowConfig const &config)
        : services_{ services }
        , config_{ config }
        , store_{ config.workflow_dir } { }

    /**
     * @brief Runs the workflow defined in the given file
     *
     * @return WorkflowExecution The persisted record of a successful run
     * @throws WorkflowDefinitionException, GraphException before anything runs
     * @throws StepFailedException if a step failed; the record has been persisted
     */
    WorkflowExecution execute_workflow(std::filesystem::path const &definition_path) {
        auto const workflow = load_workflow(definition_path);

        WorkflowExecution execution;
        execution.id          = util::make_uuid();
        execution.workflow_id = workflow.id;
        execution.status      = ExecutionStatus::Pending;
        execution.started_at  = std::chrono::system_clock::now();
        execution.variables   = workflow.variables;

        report(SimpleEvent{ "START", fmt::format("execution {} of '{}'", util::to_string(execution.id), workflow.name) });

        std::vector<std::size_t> order;
        try {
            order = scheduler_.order(workflow.steps);
        } catch(GraphException const &e) {
            report(FailureEvent{ workflow.name, { { FailureEvent::Data::Type::GRAPH, e.step_id, e.what() } } });
            throw;
        }

        execution.status = ExecutionStatus::Running;
        step_executor_t executor{ services_, config_ };

        for(auto const idx : order) {
            execution.steps_executed.push_back(executor.run(workflow.steps[idx], execution.variables));

            auto failed = std::find_if(std::begin(execution.steps_executed), std::end(execution.steps_executed),
                [](StepExecution const &step) { return step.status == ExecutionStatus::Failed; });

            if(failed != std::end(execution.steps_executed)) {
                execution.status        = ExecutionStatus::Failed;
                execution.error_message = failed->error_message;
                execution.completed_at  = std::chrono::system_clock::now();
                save_execution_record(execution);

                auto const error = failed->error_message.value_or("unknown error");
                report(FailureEvent{ workflow.name, { { FailureEvent::Data::Type::STEP, failed->step_id, error } } });
                throw StepFailedException{ failed->step_id, error, execution };
            }
        }

        execution.status       = ExecutionStatus::Completed;
        execution.completed_at = std::chrono::system_clock::now();
        save_execution_record(execution);

        report(SuccessEvent{ fmt::format("{} ({} steps)", workflow.name, execution.steps_executed.size()) });
        return execution;
    }

    // throws WorkflowDefinitionException
    Workflow load_workflow(std::filesystem::path const &definition_path) {
        try {
            auto workflow = loader_.load(definition_path);
            report(SimpleEvent{ "LOADED", fmt::format("{} (version: {})", workflow.name, workflow.version) });
            return workflow;
        } catch(WorkflowDefinitionException const &e) {
            report(FailureEvent{ e.path, { { FailureEvent::Data::Type::DEFINITION, e.path, e.reason } } });
            throw;
        }
    }

    /**
     * @brief All definitions found directly in the workflow directory
     *
     * Files that do not parse are reported and skipped.
     */
    std::vector<Workflow> list_workflows() {
        std::vector<Workflow> workflows;
        for(auto const &path : loader_.discover(config_.workflow_dir)) {
            try {
                workflows.push_back(loader_.load(path));
            } catch(WorkflowDefinitionException const &e) {
                report(WarningEvent{ "SKIPPED DEFINITION", e.what() });
            }
        }
        return workflows;
    }

    std::optional<WorkflowExecution> get_execution(util::uuid_t const &execution_id) const {
        return store_.load(execution_id);
    }

    [[nodiscard]] WorkflowConfig const &config() const {
        return config_;
    }

private:
    void save_execution_record(WorkflowExecution const &execution) {
        auto const path = store_.save(execution);
        report(DetailEvent{ "RECORD", path.string() });
    }

    void report(auto &&ev) {
        auto const &reporting = services_.template get<reporting_t>();
        reporting.get().record(std::move(ev));
    }
};
