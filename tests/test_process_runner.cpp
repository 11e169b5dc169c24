#include <gtest/gtest.h>
#include <managers/process_runner.hpp>
#include <device/adb_transport.hpp>
#include <platform/process.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <fstream>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class ScriptProcessTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "dumpfleet_process_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_script(const std::string& body) {
        auto path = test_dir / "script.sh";
        std::ofstream(path) << "#!/bin/bash\n" << body;
        return path;
    }

    // Poll until Finished arrives, collecting output along the way.
    static std::vector<ProcessEvent> drain(ExternalProcess& proc,
                                           std::chrono::milliseconds timeout = 5000ms) {
        std::vector<ProcessEvent> all;
        auto until = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < until) {
            for (auto& ev : proc.poll()) {
                bool done = ev.kind == ProcessEvent::Kind::Finished;
                all.push_back(ev);
                if (done) return all;
            }
            std::this_thread::sleep_for(10ms);
        }
        return all;
    }

    static std::string output_of(const std::vector<ProcessEvent>& events) {
        std::string out;
        for (const auto& ev : events) {
            if (ev.kind == ProcessEvent::Kind::Output) out += ev.output;
        }
        return out;
    }
};

TEST_F(ScriptProcessTest, RunsInWorkingDirWithSerial) {
    auto script = write_script("echo \"serial=$ADB_SERIAL\"\npwd\ntouch marker\nexit 3\n");
    ScriptProcessRunner runner;
    auto started = runner.start(script, test_dir, {{DEVICE_SERIAL_ENV, "R5CT20ABC"}});
    ASSERT_TRUE(started.is_ok()) << started.error;
    auto& proc = *started.value;
    EXPECT_GT(proc.pid(), 0);

    auto events = drain(proc);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().kind, ProcessEvent::Kind::Started);
    EXPECT_EQ(events.back().kind, ProcessEvent::Kind::Finished);
    EXPECT_EQ(events.back().exit_code, 3);
    EXPECT_EQ(events.back().exit_status, ExitStatus::Normal);

    auto out = output_of(events);
    EXPECT_NE(out.find("serial=R5CT20ABC"), std::string::npos);
    EXPECT_NE(out.find(fs::canonical(test_dir).string()), std::string::npos);
    EXPECT_TRUE(fs::exists(test_dir / "marker"));
    EXPECT_EQ(proc.state(), ProcessState::NotRunning);
}

TEST_F(ScriptProcessTest, KillReportsCrash) {
    auto script = write_script("sleep 30\n");
    ScriptProcessRunner runner;
    auto started = runner.start(script, test_dir, {});
    ASSERT_TRUE(started.is_ok()) << started.error;
    auto& proc = *started.value;
    EXPECT_EQ(proc.state(), ProcessState::Running);

    proc.kill();
    auto events = drain(proc);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().kind, ProcessEvent::Kind::Finished);
    EXPECT_EQ(events.back().exit_status, ExitStatus::Crashed);
}

TEST_F(ScriptProcessTest, MissingInterpreterFailsToStart) {
    auto script = write_script("exit 0\n");
    ScriptProcessRunner runner("/nonexistent/interpreter");
    auto started = runner.start(script, test_dir, {});
    EXPECT_TRUE(started.is_err());
}

TEST(ProcessErrorTest, Descriptions) {
    EXPECT_EQ(describe(ProcessError::FailedToStart), "Failed to start process");
    EXPECT_EQ(describe(ProcessError::Crashed), "Process crashed");
    EXPECT_EQ(describe(ProcessError::ReadError), "Read error");
}

TEST(RunCaptureTest, CollectsOutputAndExitCode) {
    auto r = platform::run_capture("/bin/sh", {"-c", "echo out; echo err >&2; exit 4"});
    EXPECT_TRUE(r.started);
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(r.exit_code, 4);
    EXPECT_NE(r.output.find("out"), std::string::npos);
    EXPECT_NE(r.output.find("err"), std::string::npos);
}

TEST(RunCaptureTest, TimesOut) {
    auto r = platform::run_capture("/bin/sh", {"-c", "sleep 30"}, 1);
    EXPECT_TRUE(r.started);
    EXPECT_TRUE(r.timed_out);
}

TEST(RunCaptureTest, SiblingDoesNotInheritOutputPipe) {
    auto open_fds = [] {
        auto r = platform::run_capture("/bin/ls", {"/proc/self/fd"});
        EXPECT_EQ(r.exit_code, 0) << r.output;
        return split_lines(r.output).size();
    };
    size_t baseline = open_fds();

    auto sleeper = platform::spawn("/bin/sleep", {"5"});
    ASSERT_TRUE(sleeper.is_ok()) << sleeper.error;
    EXPECT_EQ(open_fds(), baseline);

    sleeper.value.kill();
    sleeper.value.wait(2000);
}

TEST(RunCaptureTest, MissingProgram) {
    auto r = platform::run_capture("/nonexistent/tool", {});
    EXPECT_FALSE(r.started);
    EXPECT_FALSE(r.error.empty());
}

TEST(AdbTransportTest, MissingAdbIsUnavailable) {
    AdbTransport adb("/nonexistent/adb", 5);
    auto r = adb.execute("dev1", COREDUMP_LIST_CMD);
    EXPECT_TRUE(r.unavailable());
    EXPECT_FALSE(r.success());
}
