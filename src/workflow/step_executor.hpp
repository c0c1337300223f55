#pragma once

#include <config/config.hpp>
#include <process/concepts.hpp>
#include <process/exceptions.hpp>
#include <reporting/events.hpp>
#include <workflow/backoff.hpp>
#include <workflow/condition.hpp>
#include <workflow/model.hpp>

#include <di.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <string>
#include <utility>

/**
 * @brief Runs a single workflow step
 *
 * Condition gate, then up to 1 + max retries invocations of the step command with exponential
 * backoff between attempts. Timeouts and non-zero exits are both consumed by the retry loop.
 */
template <CommandRunner ProcessRunnerType, BackoffSleeper SleeperType, typename ReportEngineType>
class StepExecutor {
    using process_runner_t = ProcessRunnerType;
    using sleeper_t        = SleeperType;
    using reporting_t      = ReportEngineType;
    using services_t       = di::Deps<reporting_t, process_runner_t, sleeper_t>;

    services_t services_;
    WorkflowConfig config_;

public:
    StepExecutor(services_t services, WorkflowConfig const &config)
        : services_{ services }
        , config_{ config } { }

    StepExecution run(WorkflowStep const &step, variables_t const &variables) {
        StepExecution execution;
        execution.step_id    = step.id;
        execution.started_at = std::chrono::system_clock::now();

        report(SimpleEvent{ "STEP", fmt::format("{} ({})", step.name, step.id) });

        if(step.condition and not evaluate_condition(*step.condition, variables)) {
            execution.status       = ExecutionStatus::Skipped;
            execution.completed_at = std::chrono::system_clock::now();
            report(SimpleEvent{ "SKIP", fmt::format("{}: condition '{}' evaluated to '{}'",
                                            step.id, *step.condition, substitute_variables(*step.condition, variables)) });
            return execution;
        }

        execution.status = ExecutionStatus::Running;

        auto const max_retries = step.retry_count.value_or(config_.retry_attempts);
        auto const timeout     = std::chrono::seconds{ step.timeout.value_or(config_.timeout_seconds) };
        auto const &[runner, sleeper] = services_.template get<process_runner_t, sleeper_t>();

        for(uint64_t attempt = 0; attempt <= max_retries; ++attempt) {
            if(attempt > 0) {
                execution.retry_count = static_cast<uint32_t>(attempt);

                auto const delay = backoff_delay(attempt, config_.retry_backoff_cap_seconds);
                report(DetailEvent{ "RETRY", fmt::format("{} attempt {}/{} in {}s", step.id, attempt, max_retries, delay.count()) });
                sleeper.get().sleep_for(delay);
            }

            try {
                report(DetailEvent{ "EXEC", fmt::format("{} {}", step.command, fmt::join(step.args, " ")) });
                execution.output        = runner.get().run(step.command, step.args, variables, timeout);
                execution.error_message = std::nullopt;
                execution.status        = ExecutionStatus::Completed;
                execution.completed_at  = std::chrono::system_clock::now();

                report(SimpleEvent{ "DONE", step.id });
                return execution;
            } catch(CommandException const &e) {
                execution.error_message = e.what();
            } catch(std::exception const &e) {
                execution.error_message = fmt::format("Unexpected error running '{}': {}", step.command, e.what());
            }
            report(DetailEvent{ "ATTEMPT FAILED", fmt::format("{}: {}", step.id, *execution.error_message) });
        }

        execution.status       = ExecutionStatus::Failed;
        execution.retry_count  = max_retries;
        execution.completed_at = std::chrono::system_clock::now();

        report(WarningEvent{ "STEP FAILED", fmt::format("{} after {} retries: {}", step.id, max_retries, *execution.error_message) });
        return execution;
    }

private:
    void report(auto &&ev) {
        auto const &reporting = services_.template get<reporting_t>();
        reporting.get().record(std::move(ev));
    }
};
