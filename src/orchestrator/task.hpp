#pragma once

#include <util/time.hpp>
#include <util/uuid.hpp>

#include <optional>
#include <string>
#include <string_view>

enum class TaskKind {
    Upload,
    Workflow,
    System,
};

// declaration order is the lifecycle order
enum class TaskStatus {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled,
};

struct TaskInfo {
    util::uuid_t id{};
    TaskKind kind = TaskKind::System;
    TaskStatus status = TaskStatus::Pending;
    util::timestamp_t created_at;
    std::optional<util::timestamp_t> started_at;
    std::optional<util::timestamp_t> completed_at;
    std::optional<std::string> error_message;
};

std::string_view to_string(TaskKind kind);
std::string_view to_string(TaskStatus status);

[[nodiscard]] bool is_terminal(TaskStatus status);

/**
 * @brief Whether a task may move from one status to another
 *
 * Only forward moves are allowed: Pending -> Running -> {Completed, Failed, Cancelled}, with
 * Pending allowed to end directly. Nothing leaves a terminal status.
 */
[[nodiscard]] bool is_forward_transition(TaskStatus from, TaskStatus to);
