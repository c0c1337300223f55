#include <util/time.hpp>
#include <util/uuid.hpp>
#include <workflow/json_conversion.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace {

nlohmann::json optional_timestamp(std::optional<util::timestamp_t> const &tp) {
    if(tp)
        return util::format_timestamp(*tp);
    return nullptr;
}

nlohmann::json optional_text(std::optional<std::string> const &text) {
    if(text)
        return *text;
    return nullptr;
}

std::optional<util::timestamp_t> read_optional_timestamp(nlohmann::json const &j, char const *key) {
    if(not j.contains(key) or j.at(key).is_null())
        return std::nullopt;
    return util::parse_timestamp(j.at(key).get<std::string>());
}

std::optional<std::string> read_optional_text(nlohmann::json const &j, char const *key) {
    if(not j.contains(key) or j.at(key).is_null())
        return std::nullopt;
    return j.at(key).get<std::string>();
}

ExecutionStatus read_status(nlohmann::json const &j) {
    auto const name = j.at("status").get<std::string>();
    auto status     = execution_status_from_string(name);
    if(not status)
        throw std::invalid_argument{ "unknown execution status '" + name + "'" };
    return *status;
}

} // namespace

void to_json(nlohmann::json &j, StepExecution const &step) {
    j = nlohmann::json{
        { "step_id", step.step_id },
        { "status", std::string{ to_string(step.status) } },
        { "started_at", util::format_timestamp(step.started_at) },
        { "completed_at", optional_timestamp(step.completed_at) },
        { "output", optional_text(step.output) },
        { "error_message", optional_text(step.error_message) },
        { "retry_count", step.retry_count },
    };
}

void from_json(nlohmann::json const &j, StepExecution &step) {
    step.step_id       = j.at("step_id").get<std::string>();
    step.status        = read_status(j);
    step.started_at    = util::parse_timestamp(j.at("started_at").get<std::string>());
    step.completed_at  = read_optional_timestamp(j, "completed_at");
    step.output        = read_optional_text(j, "output");
    step.error_message = read_optional_text(j, "error_message");
    step.retry_count   = j.at("retry_count").get<uint32_t>();
}

void to_json(nlohmann::json &j, WorkflowExecution const &execution) {
    j = nlohmann::json{
        { "id", util::to_string(execution.id) },
        { "workflow_id", util::to_string(execution.workflow_id) },
        { "status", std::string{ to_string(execution.status) } },
        { "started_at", util::format_timestamp(execution.started_at) },
        { "completed_at", optional_timestamp(execution.completed_at) },
        { "steps_executed", execution.steps_executed },
        { "variables", execution.variables },
        { "error_message", optional_text(execution.error_message) },
    };
}

void from_json(nlohmann::json const &j, WorkflowExecution &execution) {
    execution.id             = util::parse_uuid(j.at("id").get<std::string>());
    execution.workflow_id    = util::parse_uuid(j.at("workflow_id").get<std::string>());
    execution.status         = read_status(j);
    execution.started_at     = util::parse_timestamp(j.at("started_at").get<std::string>());
    execution.completed_at   = read_optional_timestamp(j, "completed_at");
    execution.steps_executed = j.at("steps_executed").get<std::vector<StepExecution>>();
    execution.variables      = j.at("variables").get<variables_t>();
    execution.error_message  = read_optional_text(j, "error_message");
}
