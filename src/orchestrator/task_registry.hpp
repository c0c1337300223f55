#pragma once

#include <orchestrator/task.hpp>
#include <util/time.hpp>
#include <util/uuid.hpp>

#include <boost/container_hash/hash.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Concurrent map of task id to task lifecycle state
 *
 * Every mutation touches a single entry under the write lock; readers always get copies.
 * Status changes go through transition(), which only ever moves a task forward.
 */
class TaskRegistry {
    using map_t = std::unordered_map<util::uuid_t, TaskInfo, boost::hash<util::uuid_t>>;

    mutable std::shared_mutex mtx_;
    map_t tasks_;

public:
    // creates a Pending task and returns its id
    util::uuid_t create(TaskKind kind);

    void insert(TaskInfo const &info);

    /**
     * @brief Moves a task to the given status, stamping start or completion time
     *
     * @return true if the task exists and the move was forward; false otherwise and nothing changes
     */
    bool transition(util::uuid_t const &id, TaskStatus next, std::optional<std::string> error_message = std::nullopt);

    // applies fn to the entry under the write lock; false if no such task
    bool update(util::uuid_t const &id, std::function<void(TaskInfo &)> const &fn);

    [[nodiscard]] std::optional<TaskInfo> find(util::uuid_t const &id) const;
    [[nodiscard]] std::vector<TaskInfo> snapshot() const;
    [[nodiscard]] std::size_t size() const;

    bool remove(util::uuid_t const &id);

    // removes terminal tasks completed strictly before cutoff; returns how many were removed
    std::size_t remove_finished_before(util::timestamp_t cutoff);
};
