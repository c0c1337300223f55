#include <workflow/model.hpp>

#include <array>
#include <utility>

namespace {

constexpr std::array step_types = {
    std::pair{ StepType::Command, std::string_view{ "Command" } },
    std::pair{ StepType::Script, std::string_view{ "Script" } },
    std::pair{ StepType::Upload, std::string_view{ "Upload" } },
    std::pair{ StepType::Download, std::string_view{ "Download" } },
    std::pair{ StepType::Transform, std::string_view{ "Transform" } },
    std::pair{ StepType::Validate, std::string_view{ "Validate" } },
    std::pair{ StepType::Notify, std::string_view{ "Notify" } },
};

constexpr std::array priorities = {
    std::pair{ WorkflowPriority::Low, std::string_view{ "Low" } },
    std::pair{ WorkflowPriority::Normal, std::string_view{ "Normal" } },
    std::pair{ WorkflowPriority::High, std::string_view{ "High" } },
    std::pair{ WorkflowPriority::Critical, std::string_view{ "Critical" } },
};

constexpr std::array statuses = {
    std::pair{ ExecutionStatus::Pending, std::string_view{ "Pending" } },
    std::pair{ ExecutionStatus::Running, std::string_view{ "Running" } },
    std::pair{ ExecutionStatus::Completed, std::string_view{ "Completed" } },
    std::pair{ ExecutionStatus::Failed, std::string_view{ "Failed" } },
    std::pair{ ExecutionStatus::Cancelled, std::string_view{ "Cancelled" } },
    std::pair{ ExecutionStatus::Skipped, std::string_view{ "Skipped" } },
};

template <typename Table, typename Enum>
std::string_view name_of(Table const &table, Enum value) {
    for(auto const &[entry, name] : table) {
        if(entry == value)
            return name;
    }
    return "Unknown";
}

template <typename Enum, typename Table>
std::optional<Enum> value_of(Table const &table, std::string_view name) {
    for(auto const &[entry, entry_name] : table) {
        if(entry_name == name)
            return entry;
    }
    return std::nullopt;
}

} // namespace

std::string_view to_string(StepType type) {
    return name_of(step_types, type);
}

std::string_view to_string(WorkflowPriority priority) {
    return name_of(priorities, priority);
}

std::string_view to_string(ExecutionStatus status) {
    return name_of(statuses, status);
}

std::optional<StepType> step_type_from_string(std::string_view name) {
    return value_of<StepType>(step_types, name);
}

std::optional<WorkflowPriority> priority_from_string(std::string_view name) {
    return value_of<WorkflowPriority>(priorities, name);
}

std::optional<ExecutionStatus> execution_status_from_string(std::string_view name) {
    return value_of<ExecutionStatus>(statuses, name);
}
