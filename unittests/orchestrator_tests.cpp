#include <gtest/gtest.h>

#include <helpers.hpp>
#include <orchestrator/exceptions.hpp>
#include <orchestrator/orchestrator.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

class Gate {
    std::mutex mtx_;
    std::condition_variable cv_;
    bool open_ = false;

public:
    void wait() {
        std::unique_lock l{ mtx_ };
        cv_.wait(l, [this] { return open_; });
    }

    void open() {
        {
            std::scoped_lock l{ mtx_ };
            open_ = true;
        }
        cv_.notify_all();
    }
};

// counts how many delegates run at once; paths named "bad" fail, paths named "gated" wait for the gate
struct Delegate {
    Gate *gate = nullptr;
    std::chrono::milliseconds work{ 0 };

    std::atomic<int> active{ 0 };
    std::atomic<int> peak{ 0 };
    std::atomic<int> calls{ 0 };

    std::string perform(std::filesystem::path const &path, std::string const &prefix) {
        ++calls;
        auto const now = ++active;
        auto prev      = peak.load();
        while(prev < now and not peak.compare_exchange_weak(prev, now)) { }

        if(gate and path.filename() == "gated")
            gate->wait();
        std::this_thread::sleep_for(work);
        --active;

        if(path.filename() == "bad")
            throw std::runtime_error{ prefix + " exploded" };
        return prefix + ":" + path.string();
    }
};

struct MockEngine : public Delegate {
    std::string execute_workflow(std::filesystem::path const &path) {
        return perform(path, "workflow");
    }
};

struct MockPipeline : public Delegate {
    std::string process_upload(std::filesystem::path const &path) {
        return perform(path, "upload");
    }
};

using orchestrator_t = Orchestrator<MockEngine, MockPipeline, reporting_t>;

bool wait_until(std::function<bool()> const &predicate, std::chrono::milliseconds limit = 5000ms) {
    auto const deadline = std::chrono::steady_clock::now() + limit;
    while(std::chrono::steady_clock::now() < deadline) {
        if(predicate())
            return true;
        std::this_thread::sleep_for(2ms);
    }
    return predicate();
}

struct OrchestratorTest : public ::testing::Test {
    QuietReporting reporting;
    Gate gate;
    MockEngine engine;
    MockPipeline pipeline;
    WorkflowConfig workflow_config;
    UploadConfig upload_config;
    std::optional<orchestrator_t> orchestrator;

    void SetUp() override {
        engine.gate   = &gate;
        pipeline.gate = &gate;
    }

    void TearDown() override {
        gate.open();
        orchestrator.reset();
    }

    orchestrator_t &start(std::size_t max_workflows, bool shared = true, std::size_t max_uploads = 1) {
        workflow_config.max_concurrent_workflows   = max_workflows;
        workflow_config.share_limiter_with_uploads = shared;
        upload_config.max_concurrent_uploads       = max_uploads;

        orchestrator.emplace(di::Deps<reporting_t, MockEngine, MockPipeline>{ reporting.engine, engine, pipeline }, workflow_config, upload_config);
        return *orchestrator;
    }

    TaskStatus status_of(util::uuid_t const &id) const {
        return orchestrator->get_task_status(id).value().status;
    }
};

} // namespace

TEST_F(OrchestratorTest, WorkflowResultIsReturnedUnchanged) {
    auto &orch = start(2);

    auto submission = orch.submit_workflow("nightly.json");
    EXPECT_EQ(submission.result.get(), "workflow:nightly.json");

    auto const info = orch.get_task_status(submission.task_id);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->kind, TaskKind::Workflow);
    EXPECT_EQ(info->status, TaskStatus::Completed);
    EXPECT_TRUE(info->started_at.has_value());
    EXPECT_TRUE(info->completed_at.has_value());
    EXPECT_FALSE(info->error_message.has_value());
}

TEST_F(OrchestratorTest, UploadResultIsReturnedUnchanged) {
    auto &orch = start(2);

    auto submission = orch.submit_upload("report.txt");
    EXPECT_EQ(submission.result.get(), "upload:report.txt");
    EXPECT_EQ(orch.get_task_status(submission.task_id)->kind, TaskKind::Upload);
    EXPECT_EQ(status_of(submission.task_id), TaskStatus::Completed);
}

TEST_F(OrchestratorTest, FailureIsRecordedAndRethrown) {
    auto &orch = start(2);

    auto submission = orch.submit_workflow("bad");
    try {
        submission.result.get();
        FAIL() << "expected the delegate error";
    } catch(std::runtime_error const &e) {
        EXPECT_EQ(std::string{ e.what() }, "workflow exploded");
    }

    auto const info = orch.get_task_status(submission.task_id);
    EXPECT_EQ(info->status, TaskStatus::Failed);
    EXPECT_EQ(info->error_message, "workflow exploded");
    EXPECT_TRUE(info->completed_at.has_value());
}

TEST_F(OrchestratorTest, ConcurrencyBound) {
    engine.work   = 30ms;
    pipeline.work = 30ms;
    auto &orch    = start(2);

    std::vector<Submission<std::string>> workflows;
    std::vector<Submission<std::string>> uploads;
    for(int i = 0; i < 6; ++i) {
        workflows.push_back(orch.submit_workflow(fmt::format("wf{}.json", i)));
        uploads.push_back(orch.submit_upload(fmt::format("file{}.txt", i)));
    }

    std::size_t max_running = 0;
    auto all_done           = [&orch] {
        auto const tasks = orch.list_active_tasks();
        return std::all_of(std::begin(tasks), std::end(tasks), [](auto const &t) { return is_terminal(t.status); });
    };
    while(not all_done()) {
        auto const tasks  = orch.list_active_tasks();
        auto const running = static_cast<std::size_t>(std::count_if(std::begin(tasks), std::end(tasks), [](auto const &t) {
            return t.status == TaskStatus::Running;
        }));
        max_running = std::max(max_running, running);
        std::this_thread::sleep_for(1ms);
    }

    for(auto &s : workflows)
        EXPECT_NO_THROW(s.result.get());
    for(auto &s : uploads)
        EXPECT_NO_THROW(s.result.get());

    EXPECT_LE(max_running, 2u);
    EXPECT_LE(engine.peak.load() + pipeline.peak.load(), 4);
    EXPECT_LE(std::max(engine.peak.load(), pipeline.peak.load()), 2);
    EXPECT_EQ(orch.list_active_tasks().size(), 12u);
}

TEST_F(OrchestratorTest, SharedLimiterHoldsBackUploads) {
    auto &orch = start(1);

    auto blocker = orch.submit_workflow("gated");
    ASSERT_TRUE(wait_until([&] { return status_of(blocker.task_id) == TaskStatus::Running; }));

    auto upload = orch.submit_upload("file.txt");
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(status_of(upload.task_id), TaskStatus::Pending);
    EXPECT_EQ(pipeline.calls.load(), 0);

    gate.open();
    EXPECT_EQ(upload.result.get(), "upload:file.txt");
    EXPECT_EQ(blocker.result.get(), "workflow:gated");
}

TEST_F(OrchestratorTest, SeparateUploadLimiter) {
    auto &orch = start(1, false, 1);

    auto blocker = orch.submit_workflow("gated");
    ASSERT_TRUE(wait_until([&] { return status_of(blocker.task_id) == TaskStatus::Running; }));

    auto upload = orch.submit_upload("file.txt");
    EXPECT_EQ(upload.result.get(), "upload:file.txt");
    EXPECT_EQ(status_of(blocker.task_id), TaskStatus::Running);

    gate.open();
    EXPECT_EQ(blocker.result.get(), "workflow:gated");
}

TEST_F(OrchestratorTest, CancelPendingTaskSkipsDelegate) {
    auto &orch = start(1);

    auto blocker = orch.submit_workflow("gated");
    auto waiting = orch.submit_workflow("later.json");
    ASSERT_TRUE(wait_until([&] { return status_of(blocker.task_id) == TaskStatus::Running; }));
    ASSERT_EQ(status_of(waiting.task_id), TaskStatus::Pending);

    EXPECT_TRUE(orch.cancel_task(waiting.task_id));
    EXPECT_FALSE(orch.cancel_task(waiting.task_id));

    gate.open();
    EXPECT_EQ(blocker.result.get(), "workflow:gated");
    EXPECT_THROW(waiting.result.get(), TaskCancelledException);
    EXPECT_EQ(engine.calls.load(), 1);

    auto const info = orch.get_task_status(waiting.task_id);
    EXPECT_EQ(info->status, TaskStatus::Cancelled);
    EXPECT_TRUE(info->completed_at.has_value());
    EXPECT_FALSE(info->started_at.has_value());
}

TEST_F(OrchestratorTest, CancelledBacklogDoesNotHoldUpNewWork) {
    auto &orch = start(1);

    auto blocker = orch.submit_workflow("gated");
    ASSERT_TRUE(wait_until([&] { return status_of(blocker.task_id) == TaskStatus::Running; }));

    std::vector<Submission<std::string>> backlog;
    for(int i = 0; i < 4; ++i)
        backlog.push_back(orch.submit_workflow(fmt::format("stale{}.json", i)));
    for(auto const &s : backlog)
        EXPECT_TRUE(orch.cancel_task(s.task_id));

    auto fresh = orch.submit_upload("fresh.txt");
    gate.open();

    EXPECT_EQ(fresh.result.get(), "upload:fresh.txt");
    for(auto &s : backlog) {
        EXPECT_THROW(s.result.get(), TaskCancelledException);
        EXPECT_FALSE(orch.get_task_status(s.task_id)->started_at.has_value());
    }
    EXPECT_EQ(engine.calls.load(), 1);
    EXPECT_EQ(pipeline.calls.load(), 1);
    EXPECT_EQ(blocker.result.get(), "workflow:gated");
}

TEST_F(OrchestratorTest, CancelRunningTaskIsAdvisory) {
    auto &orch = start(1);

    auto running = orch.submit_workflow("gated");
    ASSERT_TRUE(wait_until([&] { return status_of(running.task_id) == TaskStatus::Running; }));

    EXPECT_TRUE(orch.cancel_task(running.task_id));
    gate.open();

    EXPECT_EQ(running.result.get(), "workflow:gated");
    EXPECT_EQ(status_of(running.task_id), TaskStatus::Cancelled);
}

TEST_F(OrchestratorTest, CancelFinishedOrUnknownTask) {
    auto &orch = start(1);

    auto done = orch.submit_workflow("quick.json");
    done.result.get();

    EXPECT_FALSE(orch.cancel_task(done.task_id));
    EXPECT_EQ(status_of(done.task_id), TaskStatus::Completed);
    EXPECT_FALSE(orch.cancel_task(util::make_uuid()));
}

TEST_F(OrchestratorTest, CleanupKeepsRecentTasks) {
    auto &orch = start(2);

    auto first  = orch.submit_workflow("one.json");
    auto second = orch.submit_upload("two.txt");
    first.result.get();
    second.result.get();

    EXPECT_EQ(orch.cleanup_completed_tasks(), 0u);
    EXPECT_EQ(orch.cleanup_completed_tasks(), 0u);
    EXPECT_EQ(orch.list_active_tasks().size(), 2u);
}

TEST_F(OrchestratorTest, DestructionWaitsForTasks) {
    engine.work = 20ms;
    auto &orch  = start(2);

    for(int i = 0; i < 5; ++i)
        static_cast<void>(orch.submit_workflow(fmt::format("wf{}.json", i)));

    orchestrator.reset();
    EXPECT_EQ(engine.calls.load(), 5);
    EXPECT_EQ(engine.active.load(), 0);
}
