#pragma once

#include <util/time.hpp>
#include <util/uuid.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class StepType {
    Command,
    Script,
    Upload,
    Download,
    Transform,
    Validate,
    Notify,
};

enum class WorkflowPriority {
    Low,
    Normal,
    High,
    Critical,
};

enum class ExecutionStatus {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled,
    Skipped,
};

using variables_t = std::map<std::string, std::string>;

struct ResourceRequirements {
    uint32_t cpu_cores     = 0;
    uint32_t memory_mb     = 0;
    uint32_t disk_space_mb = 0;
};

struct WorkflowMetadata {
    std::string author;
    std::vector<std::string> tags;
    WorkflowPriority priority = WorkflowPriority::Normal;
    std::optional<uint64_t> estimated_duration;
    ResourceRequirements resource_requirements;
};

struct WorkflowStep {
    std::string id;
    std::string name;
    StepType step_type = StepType::Command;
    std::string command;
    std::vector<std::string> args;
    std::optional<uint64_t> timeout; // seconds
    std::optional<uint32_t> retry_count;
    std::vector<std::string> depends_on;
    std::optional<std::string> condition;
    std::optional<std::string> output; // informational, never written back into the variables
};

struct Workflow {
    util::uuid_t id{};
    std::string name;
    std::optional<std::string> description;
    std::string version;
    util::timestamp_t created_at;
    std::vector<WorkflowStep> steps;
    variables_t variables;
    WorkflowMetadata metadata;
};

struct StepExecution {
    std::string step_id;
    ExecutionStatus status = ExecutionStatus::Pending;
    util::timestamp_t started_at;
    std::optional<util::timestamp_t> completed_at;
    std::optional<std::string> output;
    std::optional<std::string> error_message;
    uint32_t retry_count = 0;
};

struct WorkflowExecution {
    util::uuid_t id{};
    util::uuid_t workflow_id{};
    ExecutionStatus status = ExecutionStatus::Pending;
    util::timestamp_t started_at;
    std::optional<util::timestamp_t> completed_at;
    std::vector<StepExecution> steps_executed;
    variables_t variables;
    std::optional<std::string> error_message;
};

std::string_view to_string(StepType type);
std::string_view to_string(WorkflowPriority priority);
std::string_view to_string(ExecutionStatus status);

// the parse functions return std::nullopt for unknown names
std::optional<StepType> step_type_from_string(std::string_view name);
std::optional<WorkflowPriority> priority_from_string(std::string_view name);
std::optional<ExecutionStatus> execution_status_from_string(std::string_view name);

