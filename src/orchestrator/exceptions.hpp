#pragma once

#include <util/uuid.hpp>

#include <fmt/format.h>

#include <stdexcept>

// raised through the future of a task that was cancelled before it started running
struct TaskCancelledException : public std::runtime_error {
    TaskCancelledException(util::uuid_t const &task_id)
        : std::runtime_error{ fmt::format("Task {} was cancelled before it started", util::to_string(task_id)) }
        , task_id{ task_id } { }
    util::uuid_t task_id;
};
