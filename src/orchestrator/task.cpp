#include <orchestrator/task.hpp>

namespace {

int stage_of(TaskStatus status) {
    switch(status) {
    case TaskStatus::Pending:
        return 0;
    case TaskStatus::Running:
        return 1;
    case TaskStatus::Completed:
    case TaskStatus::Failed:
    case TaskStatus::Cancelled:
        return 2;
    }
    return 2;
}

} // namespace

std::string_view to_string(TaskKind kind) {
    switch(kind) {
    case TaskKind::Upload:
        return "Upload";
    case TaskKind::Workflow:
        return "Workflow";
    case TaskKind::System:
        return "System";
    }
    return "Unknown";
}

std::string_view to_string(TaskStatus status) {
    switch(status) {
    case TaskStatus::Pending:
        return "Pending";
    case TaskStatus::Running:
        return "Running";
    case TaskStatus::Completed:
        return "Completed";
    case TaskStatus::Failed:
        return "Failed";
    case TaskStatus::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

bool is_terminal(TaskStatus status) {
    return stage_of(status) == 2;
}

bool is_forward_transition(TaskStatus from, TaskStatus to) {
    return stage_of(to) > stage_of(from);
}
