#include <gtest/gtest.h>
#include <managers/dump_job.hpp>
#include "fakes/fake_process_runner.hpp"
#include "fakes/fake_prompter.hpp"
#include "fakes/fake_transport.hpp"
#include <algorithm>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

// Collects what a job reports through its sink.
class EventLog {
public:
    DumpEventSink sink() {
        return [this](const DumpEvent& ev) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                events_.push_back(ev);
            }
            cv_.notify_all();
        };
    }

    bool wait_finished(std::chrono::milliseconds timeout = 3000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return finished_count_locked() > 0; });
    }

    bool wait_state(DumpState s, std::chrono::milliseconds timeout = 3000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] {
            for (const auto& ev : events_) {
                if (ev.kind == DumpEvent::Kind::StatusChanged && ev.new_state == s) return true;
            }
            return false;
        });
    }

    int finished_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return finished_count_locked();
    }

    DumpOutcome outcome() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& ev : events_) {
            if (ev.kind == DumpEvent::Kind::Finished) return ev.outcome;
        }
        return {};
    }

    std::vector<std::pair<DumpState, DumpState>> transitions() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::pair<DumpState, DumpState>> out;
        for (const auto& ev : events_) {
            if (ev.kind == DumpEvent::Kind::StatusChanged) {
                out.emplace_back(ev.old_state, ev.new_state);
            }
        }
        return out;
    }

    std::vector<std::string> progress() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto& ev : events_) {
            if (ev.kind == DumpEvent::Kind::Progress) out.push_back(ev.message);
        }
        return out;
    }

private:
    int finished_count_locked() const {
        int n = 0;
        for (const auto& ev : events_) {
            if (ev.kind == DumpEvent::Kind::Finished) ++n;
        }
        return n;
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<DumpEvent> events_;
};

using Edge = std::pair<DumpState, DumpState>;

class DumpJobTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path script;
    FakeProcessRunner runner;
    FakeTransport transport;
    FakePrompter prompter;
    EventLog log;
    DumpJobTiming timing;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "dumpfleet_job_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        script = test_dir / "extract.sh";
        std::ofstream(script) << "#!/bin/bash\nexit 0\n";

        timing.headless_timeout = 2000ms;
        timing.interactive_timeout = 2000ms;
        timing.cancel_grace = 100ms;
        timing.tick = 20ms;
        timing.poll = 5ms;
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::unique_ptr<DumpJob> make_job(const std::string& device = "dev1") {
        return std::make_unique<DumpJob>(device, runner, transport, &prompter, log.sink(), timing);
    }

    fs::path device_dir(const std::string& device = "dev1") {
        return test_dir / "issue" / device;
    }

    static bool contains(const std::vector<Edge>& edges, Edge e) {
        return std::find(edges.begin(), edges.end(), e) != edges.end();
    }
};

TEST_F(DumpJobTest, CompletesWhenArchiveIsProduced) {
    auto job = make_job();
    ASSERT_TRUE(job->start(DumpTrigger::Manual, DumpMode::Interactive, device_dir(), script));

    auto control = runner.wait_for("dev1");
    ASSERT_NE(control, nullptr);
    control->finish(0);

    ASSERT_TRUE(log.wait_finished());
    job->wait();

    auto outcome = log.outcome();
    EXPECT_TRUE(outcome.success());
    EXPECT_EQ(outcome.final_state, DumpState::Completed);
    EXPECT_EQ(outcome.archive_count, 1);
    EXPECT_EQ(outcome.detail, "Dump completed successfully - 1 zip files created");
    EXPECT_EQ(outcome.dump_path, device_dir());

    std::vector<Edge> expected = {
        {DumpState::Idle, DumpState::Starting},
        {DumpState::Starting, DumpState::Extracting},
        {DumpState::Extracting, DumpState::Verifying},
        {DumpState::Verifying, DumpState::Completed},
        {DumpState::Completed, DumpState::Idle},
    };
    EXPECT_EQ(log.transitions(), expected);
    EXPECT_EQ(job->state(), DumpState::Idle);
    EXPECT_EQ(log.finished_count(), 1);
}

TEST_F(DumpJobTest, ScriptGetsDeviceSerialAndWorkingDir) {
    auto job = make_job("R5CT20ABC");
    ASSERT_TRUE(job->start(DumpTrigger::Manual, DumpMode::Headless, device_dir("R5CT20ABC"), script));

    auto control = runner.wait_for("R5CT20ABC");
    ASSERT_NE(control, nullptr);
    EXPECT_EQ(control->working_dir, device_dir("R5CT20ABC"));
    EXPECT_EQ(runner.last_program, script);
    EXPECT_EQ(runner.last_env[DEVICE_SERIAL_ENV], "R5CT20ABC");
    EXPECT_TRUE(fs::is_directory(device_dir("R5CT20ABC")));

    control->finish(0);
    ASSERT_TRUE(log.wait_finished());
}

TEST_F(DumpJobTest, NonZeroExitFails) {
    auto job = make_job();
    ASSERT_TRUE(job->start(DumpTrigger::Manual, DumpMode::Interactive, device_dir(), script));
    runner.wait_for("dev1")->finish(1);

    ASSERT_TRUE(log.wait_finished());
    job->wait();

    auto outcome = log.outcome();
    EXPECT_EQ(outcome.error, DumpErrorKind::Process);
    EXPECT_EQ(outcome.final_state, DumpState::Failed);
    EXPECT_EQ(outcome.detail, "Process failed with exit_code: 1");
    EXPECT_TRUE(contains(log.transitions(), {DumpState::Extracting, DumpState::Failed}));
    EXPECT_FALSE(contains(log.transitions(), {DumpState::Extracting, DumpState::Verifying}));
}

TEST_F(DumpJobTest, CrashedProcessFails) {
    auto job = make_job();
    ASSERT_TRUE(job->start(DumpTrigger::Manual, DumpMode::Headless, device_dir(), script));
    runner.wait_for("dev1")->finish(-1, ExitStatus::Crashed);

    ASSERT_TRUE(log.wait_finished());
    EXPECT_EQ(log.outcome().error, DumpErrorKind::Process);
    EXPECT_EQ(log.outcome().detail, "Process crashed");
}

TEST_F(DumpJobTest, PipeErrorKillsAndFails) {
    auto job = make_job();
    ASSERT_TRUE(job->start(DumpTrigger::Manual, DumpMode::Headless, device_dir(), script));
    auto control = runner.wait_for("dev1");
    control->error(ProcessError::ReadError);

    ASSERT_TRUE(log.wait_finished());
    EXPECT_EQ(log.outcome().error, DumpErrorKind::Process);
    EXPECT_EQ(log.outcome().detail, describe(ProcessError::ReadError));
    EXPECT_EQ(control->kills(), 1);
}

TEST_F(DumpJobTest, MissingScriptIsSetupFailure) {
    auto job = make_job();
    ASSERT_TRUE(job->start(DumpTrigger::Manual, DumpMode::Interactive, device_dir(),
                           test_dir / "nope.sh"));

    ASSERT_TRUE(log.wait_finished());
    job->wait();

    auto outcome = log.outcome();
    EXPECT_EQ(outcome.error, DumpErrorKind::Setup);
    EXPECT_NE(outcome.detail.find("Dump script not found"), std::string::npos);
    EXPECT_EQ(runner.starts(), 0);

    std::vector<Edge> expected = {
        {DumpState::Idle, DumpState::Starting},
        {DumpState::Starting, DumpState::Failed},
        {DumpState::Failed, DumpState::Idle},
    };
    EXPECT_EQ(log.transitions(), expected);
}

TEST_F(DumpJobTest, LaunchFailureIsProcessError) {
    runner.fail_start = true;
    auto job = make_job();
    ASSERT_TRUE(job->start(DumpTrigger::Manual, DumpMode::Headless, device_dir(), script));

    ASSERT_TRUE(log.wait_finished());
    EXPECT_EQ(log.outcome().error, DumpErrorKind::Process);
    EXPECT_EQ(log.outcome().detail, "Failed to start process");
    EXPECT_TRUE(contains(log.transitions(), {DumpState::Starting, DumpState::Failed}));
}

TEST_F(DumpJobTest, CleanExitWithoutArchiveFailsVerification) {
    runner.archive = FakeProcessControl::Archive::None;
    auto job = make_job();
    ASSERT_TRUE(job->start(DumpTrigger::Manual, DumpMode::Headless, device_dir(), script));
    runner.wait_for("dev1")->finish(0);

    ASSERT_TRUE(log.wait_finished());
    EXPECT_EQ(log.outcome().error, DumpErrorKind::Verification);
    EXPECT_EQ(log.outcome().detail, "No zip files found");
    EXPECT_TRUE(contains(log.transitions(), {DumpState::Verifying, DumpState::Failed}));
}

TEST_F(DumpJobTest, EmptyArchiveFailsVerification) {
    runner.archive = FakeProcessControl::Archive::Empty;
    auto job = make_job();
    ASSERT_TRUE(job->start(DumpTrigger::Manual, DumpMode::Headless, device_dir(), script));
    runner.wait_for("dev1")->finish(0);

    ASSERT_TRUE(log.wait_finished());
    EXPECT_EQ(log.outcome().error, DumpErrorKind::Verification);
    EXPECT_EQ(log.outcome().detail, "No valid zip files found");
}

TEST_F(DumpJobTest, CancelWithCleanupEscalatesToKill) {
    runner.ignore_terminate = true;
    auto job = make_job();
    ASSERT_TRUE(job->start(DumpTrigger::Manual, DumpMode::Interactive, device_dir(), script));
    auto control = runner.wait_for("dev1");
    ASSERT_TRUE(log.wait_state(DumpState::Extracting));

    EXPECT_TRUE(job->cancel(CancelDecision{true, true}));
    EXPECT_FALSE(job->cancel(CancelDecision{true, true}));
    ASSERT_TRUE(log.wait_finished());
    job->wait();

    auto outcome = log.outcome();
    EXPECT_TRUE(outcome.cancelled());
    EXPECT_EQ(outcome.final_state, DumpState::Idle);
    EXPECT_EQ(outcome.detail, "Dump extraction cancelled by user");
    EXPECT_EQ(control->terminates(), 1);
    EXPECT_EQ(control->kills(), 1);
    EXPECT_EQ(transport.count(DEVICE_CLEANUP_CMD), 1);

    auto edges = log.transitions();
    EXPECT_TRUE(contains(edges, {DumpState::Extracting, DumpState::Idle}));
    EXPECT_FALSE(contains(edges, {DumpState::Extracting, DumpState::Failed}));
    EXPECT_EQ(job->state(), DumpState::Idle);
}

TEST_F(DumpJobTest, CancelWithoutCleanupLeavesDeviceAlone) {
    auto job = make_job();
    ASSERT_TRUE(job->start(DumpTrigger::Manual, DumpMode::Interactive, device_dir(), script));
    auto control = runner.wait_for("dev1");
    ASSERT_TRUE(log.wait_state(DumpState::Extracting));

    EXPECT_TRUE(job->cancel(CancelDecision{true, false}));
    ASSERT_TRUE(log.wait_finished());

    EXPECT_TRUE(log.outcome().cancelled());
    EXPECT_EQ(control->terminates(), 1);
    EXPECT_EQ(control->kills(), 0);
    EXPECT_EQ(transport.count(DEVICE_CLEANUP_CMD), 0);
}

TEST_F(DumpJobTest, UnconfirmedCancelKeepsExtracting) {
    auto job = make_job();
    ASSERT_TRUE(job->start(DumpTrigger::Manual, DumpMode::Interactive, device_dir(), script));
    auto control = runner.wait_for("dev1");
    ASSERT_TRUE(log.wait_state(DumpState::Extracting));

    EXPECT_FALSE(job->cancel(CancelDecision{false, true}));
    EXPECT_FALSE(job->cancellation_requested());
    EXPECT_TRUE(control->is_running());
    EXPECT_EQ(job->state(), DumpState::Extracting);

    control->finish(0);
    ASSERT_TRUE(log.wait_finished());
    EXPECT_TRUE(log.outcome().success());
}

TEST_F(DumpJobTest, HeadlessJobRefusesCancel) {
    auto job = make_job();
    ASSERT_TRUE(job->start(DumpTrigger::CrashMonitor, DumpMode::Headless, device_dir(), script));
    auto control = runner.wait_for("dev1");
    ASSERT_TRUE(log.wait_state(DumpState::Extracting));

    EXPECT_FALSE(job->cancel(CancelDecision{true, false}));
    EXPECT_FALSE(job->cancellation_requested());
    EXPECT_EQ(control->terminates(), 0);

    control->finish(0);
    ASSERT_TRUE(log.wait_finished());
}

TEST_F(DumpJobTest, HeadlessTimeoutKillsAndFails) {
    timing.headless_timeout = 150ms;
    auto job = make_job();
    ASSERT_TRUE(job->start(DumpTrigger::CrashMonitor, DumpMode::Headless, device_dir(), script));
    auto control = runner.wait_for("dev1");

    ASSERT_TRUE(log.wait_finished());
    job->wait();

    auto outcome = log.outcome();
    EXPECT_EQ(outcome.error, DumpErrorKind::Timeout);
    EXPECT_EQ(outcome.final_state, DumpState::Failed);
    EXPECT_EQ(outcome.detail, "Dump extraction timed out");
    EXPECT_EQ(control->kills(), 1);
    EXPECT_TRUE(contains(log.transitions(), {DumpState::Extracting, DumpState::Failed}));

    // Elapsed-time notices while unattended, no completion dialog
    int ticks = 0;
    for (const auto& msg : log.progress()) {
        if (msg.rfind("Extracting coredump... (", 0) == 0 && msg.back() == ')' &&
            msg.find("PID") == std::string::npos) {
            ++ticks;
        }
    }
    EXPECT_GE(ticks, 1);
    EXPECT_TRUE(prompter.completions().empty());
}

TEST_F(DumpJobTest, InteractiveJobShowsCompletion) {
    auto job = make_job();
    ASSERT_TRUE(job->start(DumpTrigger::Manual, DumpMode::Interactive, device_dir(), script));
    runner.wait_for("dev1")->finish(0);
    ASSERT_TRUE(log.wait_finished());
    job->wait();

    auto shown = prompter.completions();
    ASSERT_EQ(shown.size(), 1u);
    EXPECT_TRUE(shown[0].success());
    EXPECT_EQ(shown[0].device_id, "dev1");
}

TEST_F(DumpJobTest, ScriptOutputGoesToExtractionLog) {
    auto job = make_job();
    ASSERT_TRUE(job->start(DumpTrigger::Manual, DumpMode::Headless, device_dir(), script));
    auto control = runner.wait_for("dev1");
    control->output("pulling /data/log\n");
    control->finish(0);
    ASSERT_TRUE(log.wait_finished());
    job->wait();

    std::ifstream in(device_dir() / EXTRACTION_LOG_NAME);
    ASSERT_TRUE(in.good());
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_NE(ss.str().find("pulling /data/log"), std::string::npos);
}

TEST_F(DumpJobTest, StartRejectedWhileRunning) {
    auto job = make_job();
    ASSERT_TRUE(job->start(DumpTrigger::Manual, DumpMode::Headless, device_dir(), script));
    auto control = runner.wait_for("dev1");

    EXPECT_FALSE(job->start(DumpTrigger::Manual, DumpMode::Headless, device_dir(), script));
    EXPECT_EQ(runner.starts(), 1);

    control->finish(0);
    ASSERT_TRUE(log.wait_finished());
}

TEST_F(DumpJobTest, StopKillsWithoutReporting) {
    auto job = make_job();
    ASSERT_TRUE(job->start(DumpTrigger::Manual, DumpMode::Headless, device_dir(), script));
    auto control = runner.wait_for("dev1");
    ASSERT_TRUE(log.wait_state(DumpState::Extracting));

    job->stop();
    EXPECT_EQ(control->kills(), 1);
    EXPECT_EQ(log.finished_count(), 0);
    EXPECT_EQ(runner.live(), 0);
}
