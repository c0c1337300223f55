#pragma once

#include <config/config.hpp>
#include <orchestrator/exceptions.hpp>
#include <orchestrator/task.hpp>
#include <orchestrator/task_registry.hpp>
#include <reporting/events.hpp>
#include <util/concurrency_limiter.hpp>
#include <util/uuid.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <di.hpp>
#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

template <typename ResultType>
struct Submission {
    util::uuid_t task_id;
    std::future<ResultType> result;
};

/**
 * @brief Supervises workflow and upload tasks under a bounded number of permits
 *
 * Every submission is tracked in the TaskRegistry from Pending to a terminal status.
 * Task bodies run on worker threads; a task only enters Running once it holds a permit
 * and reaches its terminal status before the permit is given back.
 */
template <typename WorkflowEngineType, typename UploadPipelineType, typename ReportEngineType>
class Orchestrator {
    using workflow_engine_t = WorkflowEngineType;
    using upload_pipeline_t = UploadPipelineType;
    using reporting_t       = ReportEngineType;

public:
    using services_t        = di::Deps<reporting_t, workflow_engine_t, upload_pipeline_t>;
    using workflow_result_t = decltype(std::declval<workflow_engine_t &>().execute_workflow(std::declval<std::filesystem::path const &>()));
    using upload_result_t   = decltype(std::declval<upload_pipeline_t &>().process_upload(std::declval<std::filesystem::path const &>()));

    static constexpr auto retention = std::chrono::hours{ 24 };

private:
    // a limiter and the worker threads admitted through it
    struct Lane {
        explicit Lane(std::size_t capacity)
            : limiter{ capacity }
            , pool{ capacity } { }

        util::ConcurrencyLimiter limiter;
        boost::asio::thread_pool pool;
    };

    services_t services_;
    TaskRegistry registry_;
    std::unique_ptr<Lane> workflow_lane_;
    std::unique_ptr<Lane> upload_lane_; // null when uploads share the workflow lane

public:
    Orchestrator(services_t services, WorkflowConfig const &workflow_config, UploadConfig const &upload_config)
        : services_{ services }
        , workflow_lane_{ std::make_unique<Lane>(workflow_config.max_concurrent_workflows) } {
        if(not workflow_config.share_limiter_with_uploads)
            upload_lane_ = std::make_unique<Lane>(upload_config.max_concurrent_uploads);
    }

    Orchestrator(Orchestrator const &)            = delete;
    Orchestrator &operator=(Orchestrator const &) = delete;

    // waits for every submitted task to finish
    ~Orchestrator() {
        workflow_lane_->pool.join();
        if(upload_lane_)
            upload_lane_->pool.join();
    }

    Submission<workflow_result_t> submit_workflow(std::filesystem::path const &definition_path) {
        return submit<workflow_result_t>(TaskKind::Workflow, definition_path, [this](std::filesystem::path const &path) {
            return services_.template get<workflow_engine_t>().get().execute_workflow(path);
        });
    }

    Submission<upload_result_t> submit_upload(std::filesystem::path const &file_path) {
        return submit<upload_result_t>(TaskKind::Upload, file_path, [this](std::filesystem::path const &path) {
            return services_.template get<upload_pipeline_t>().get().process_upload(path);
        });
    }

    [[nodiscard]] std::optional<TaskInfo> get_task_status(util::uuid_t const &task_id) const {
        return registry_.find(task_id);
    }

    // every tracked task, each one a consistent copy
    [[nodiscard]] std::vector<TaskInfo> list_active_tasks() const {
        return registry_.snapshot();
    }

    /**
     * @brief Marks a Pending or Running task as Cancelled
     *
     * A Pending task will not run at all. A Running task is not interrupted; its command runs to
     * completion and the caller still receives its outcome, but the registry keeps Cancelled.
     *
     * @return true if the task was tracked and not yet finished
     */
    bool cancel_task(util::uuid_t const &task_id) {
        if(not registry_.transition(task_id, TaskStatus::Cancelled))
            return false;

        auto const info = registry_.find(task_id);
        report(TaskEvent{ util::to_string(task_id), std::string{ to_string(info ? info->kind : TaskKind::System) },
            std::string{ to_string(TaskStatus::Cancelled) }, "cancelled on request" });
        return true;
    }

    // removes finished tasks older than the retention window; returns how many were removed
    std::size_t cleanup_completed_tasks() {
        auto const removed = registry_.remove_finished_before(std::chrono::system_clock::now() - retention);
        if(removed > 0)
            report(DetailEvent{ "CLEANUP", fmt::format("removed {} finished task(s)", removed) });
        return removed;
    }

private:
    Lane &lane_for(TaskKind kind) {
        if(kind == TaskKind::Upload and upload_lane_)
            return *upload_lane_;
        return *workflow_lane_;
    }

    template <typename ResultType, typename DelegateType>
    Submission<ResultType> submit(TaskKind kind, std::filesystem::path const &path, DelegateType delegate) {
        auto const task_id = registry_.create(kind);
        report_status(task_id, kind, TaskStatus::Pending, path);

        auto &lane = lane_for(kind);
        auto task  = std::make_shared<std::packaged_task<ResultType()>>(
            [this, &lane, task_id, kind, path, delegate = std::move(delegate)]() {
                return supervise<ResultType>(lane, task_id, kind, path, delegate);
            });

        auto result = task->get_future();
        boost::asio::post(lane.pool, [task] { (*task)(); });

        return { task_id, std::move(result) };
    }

    template <typename ResultType, typename DelegateType>
    ResultType supervise(Lane &lane, util::uuid_t const &task_id, TaskKind kind, std::filesystem::path const &path, DelegateType const &delegate) {
        if(auto const info = registry_.find(task_id); info and info->status == TaskStatus::Cancelled)
            throw TaskCancelledException{ task_id };

        auto const permit = lane.limiter.acquire();

        // cancellation may also land while waiting for the permit
        if(not registry_.transition(task_id, TaskStatus::Running))
            throw TaskCancelledException{ task_id };
        report_status(task_id, kind, TaskStatus::Running, path);

        try {
            auto result = delegate(path);
            if(registry_.transition(task_id, TaskStatus::Completed))
                report_status(task_id, kind, TaskStatus::Completed, path);
            return result;
        } catch(std::exception const &e) {
            if(registry_.transition(task_id, TaskStatus::Failed, e.what()))
                report(FailureEvent{ path.string(), { { FailureEvent::Data::Type::TASK, util::to_string(task_id), e.what() } } });
            throw;
        }
    }

    void report_status(util::uuid_t const &task_id, TaskKind kind, TaskStatus status, std::filesystem::path const &path) {
        report(TaskEvent{ util::to_string(task_id), std::string{ to_string(kind) }, std::string{ to_string(status) }, path.string() });
    }

    void report(auto &&ev) {
        auto const &reporting = services_.template get<reporting_t>();
        reporting.get().record(std::move(ev));
    }
};
