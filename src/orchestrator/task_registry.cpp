#include <orchestrator/task_registry.hpp>

#include <chrono>
#include <mutex>
#include <utility>

util::uuid_t TaskRegistry::create(TaskKind kind) {
    TaskInfo info;
    info.id         = util::make_uuid();
    info.kind       = kind;
    info.status     = TaskStatus::Pending;
    info.created_at = std::chrono::system_clock::now();

    insert(info);
    return info.id;
}

void TaskRegistry::insert(TaskInfo const &info) {
    std::unique_lock l{ mtx_ };
    tasks_.insert_or_assign(info.id, info);
}

bool TaskRegistry::transition(util::uuid_t const &id, TaskStatus next, std::optional<std::string> error_message) {
    std::unique_lock l{ mtx_ };

    auto it = tasks_.find(id);
    if(it == std::end(tasks_))
        return false;

    auto &task = it->second;
    if(not is_forward_transition(task.status, next))
        return false;

    auto const now = std::chrono::system_clock::now();
    task.status    = next;
    if(next == TaskStatus::Running)
        task.started_at = now;
    if(is_terminal(next))
        task.completed_at = now;
    if(error_message)
        task.error_message = std::move(error_message);

    return true;
}

bool TaskRegistry::update(util::uuid_t const &id, std::function<void(TaskInfo &)> const &fn) {
    std::unique_lock l{ mtx_ };

    auto it = tasks_.find(id);
    if(it == std::end(tasks_))
        return false;

    fn(it->second);
    return true;
}

std::optional<TaskInfo> TaskRegistry::find(util::uuid_t const &id) const {
    std::shared_lock l{ mtx_ };

    auto it = tasks_.find(id);
    if(it == std::end(tasks_))
        return std::nullopt;
    return it->second;
}

std::vector<TaskInfo> TaskRegistry::snapshot() const {
    std::shared_lock l{ mtx_ };

    std::vector<TaskInfo> tasks;
    tasks.reserve(tasks_.size());
    for(auto const &[id, info] : tasks_)
        tasks.push_back(info);
    return tasks;
}

std::size_t TaskRegistry::size() const {
    std::shared_lock l{ mtx_ };
    return tasks_.size();
}

bool TaskRegistry::remove(util::uuid_t const &id) {
    std::unique_lock l{ mtx_ };
    return tasks_.erase(id) > 0;
}

std::size_t TaskRegistry::remove_finished_before(util::timestamp_t cutoff) {
    std::unique_lock l{ mtx_ };

    auto const removed = std::erase_if(tasks_, [cutoff](auto const &entry) {
        auto const &task = entry.second;
        return is_terminal(task.status) and task.completed_at and *task.completed_at < cutoff;
    });
    return static_cast<std::size_t>(removed);
}
