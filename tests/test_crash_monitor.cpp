#include <gtest/gtest.h>
#include <managers/crash_monitor.hpp>
#include "fakes/fake_transport.hpp"
#include <atomic>

struct Trigger {
    std::string device;
    std::vector<std::string> coredumps;
};

class CrashMonitorTest : public ::testing::Test {
protected:
    FakeTransport transport;
    std::vector<Trigger> triggers;
    bool busy = false;

    std::unique_ptr<CrashMonitor> make_monitor(std::vector<std::string> devices) {
        CrashMonitorConfig config;
        config.enabled = true;
        config.interval_ms = 100;
        auto monitor = std::make_unique<CrashMonitor>(
            transport, config,
            [this](const std::string& d, const std::vector<std::string>& c) {
                triggers.push_back({d, c});
            },
            [this] { return busy; });
        monitor->update_devices(std::move(devices));
        return monitor;
    }
};

TEST_F(CrashMonitorTest, ParseListingKeepsCoredumps) {
    auto names = CrashMonitor::parse_listing(
        "core.audiod.1000.1727780000.zst\r\n"
        "\n"
        "  core.netd.0.1727780100.zst  \n"
        "README\n");
    EXPECT_EQ(names, (std::vector<std::string>{"core.audiod.1000.1727780000.zst",
                                               "core.netd.0.1727780100.zst"}));
}

TEST_F(CrashMonitorTest, ParseListingSkipsLsErrors) {
    auto names = CrashMonitor::parse_listing(
        "ls: /data/var/lib/systemd/systemd-coredump/: No such file or directory\n");
    EXPECT_TRUE(names.empty());
    EXPECT_TRUE(CrashMonitor::parse_listing("").empty());
}

TEST_F(CrashMonitorTest, NewCoredumpTriggersOnce) {
    auto monitor = make_monitor({"dev1", "dev2"});
    transport.respond("dev2", COREDUMP_LIST_CMD, ShellResult::ok("core.a.1\n"));

    EXPECT_TRUE(monitor->poll_once());
    ASSERT_EQ(triggers.size(), 1u);
    EXPECT_EQ(triggers[0].device, "dev2");
    EXPECT_EQ(triggers[0].coredumps, std::vector<std::string>{"core.a.1"});

    // Same listing: nothing new
    EXPECT_FALSE(monitor->poll_once());
    EXPECT_EQ(triggers.size(), 1u);

    // Another file appears
    transport.respond("dev2", COREDUMP_LIST_CMD, ShellResult::ok("core.a.1\ncore.b.2\n"));
    EXPECT_TRUE(monitor->poll_once());
    ASSERT_EQ(triggers.size(), 2u);
    EXPECT_EQ(triggers[1].coredumps, std::vector<std::string>{"core.b.2"});
}

TEST_F(CrashMonitorTest, CoredumpPresentOnFirstScanTriggers) {
    auto monitor = make_monitor({"dev1"});
    transport.respond("dev1", COREDUMP_LIST_CMD, ShellResult::ok("core.old.1\n"));
    EXPECT_TRUE(monitor->poll_once());
    EXPECT_EQ(triggers.size(), 1u);
}

TEST_F(CrashMonitorTest, ReappearingNameTriggersAgain) {
    auto monitor = make_monitor({"dev1"});
    transport.respond("dev1", COREDUMP_LIST_CMD, ShellResult::ok("core.x.1\n"));
    EXPECT_TRUE(monitor->poll_once());

    // Extraction deleted it
    transport.respond("dev1", COREDUMP_LIST_CMD, ShellResult::ok(""));
    EXPECT_FALSE(monitor->poll_once());

    transport.respond("dev1", COREDUMP_LIST_CMD, ShellResult::ok("core.x.1\n"));
    EXPECT_TRUE(monitor->poll_once());
    EXPECT_EQ(triggers.size(), 2u);
}

TEST_F(CrashMonitorTest, OneRequestPerScan) {
    auto monitor = make_monitor({"dev1", "dev2"});
    transport.respond("dev1", COREDUMP_LIST_CMD, ShellResult::ok("core.a.1\n"));
    transport.respond("dev2", COREDUMP_LIST_CMD, ShellResult::ok("core.b.1\n"));

    EXPECT_TRUE(monitor->poll_once());
    ASSERT_EQ(triggers.size(), 1u);
    EXPECT_EQ(triggers[0].device, "dev1");

    // dev2 is picked up by the next scan
    EXPECT_TRUE(monitor->poll_once());
    ASSERT_EQ(triggers.size(), 2u);
    EXPECT_EQ(triggers[1].device, "dev2");
}

TEST_F(CrashMonitorTest, BusyFleetPausesScanning) {
    auto monitor = make_monitor({"dev1"});
    transport.respond("dev1", COREDUMP_LIST_CMD, ShellResult::ok("core.a.1\n"));

    busy = true;
    EXPECT_FALSE(monitor->poll_once());
    EXPECT_TRUE(transport.calls().empty());

    busy = false;
    EXPECT_TRUE(monitor->poll_once());
}

TEST_F(CrashMonitorTest, UnreachableDeviceIsSkipped) {
    auto monitor = make_monitor({"dev1", "dev2"});
    transport.respond("dev1", COREDUMP_LIST_CMD, ShellResult::unavailable("device offline"));
    transport.respond("dev2", COREDUMP_LIST_CMD, ShellResult::ok("core.b.1\n"));

    EXPECT_TRUE(monitor->poll_once());
    ASSERT_EQ(triggers.size(), 1u);
    EXPECT_EQ(triggers[0].device, "dev2");
}

TEST_F(CrashMonitorTest, MissingDirectoryHoldsNoCoredumps) {
    auto monitor = make_monitor({"dev1"});
    transport.respond("dev1", COREDUMP_LIST_CMD,
                      ShellResult::failed(1, "ls: /data/var/lib/systemd/systemd-coredump/: "
                                             "No such file or directory"));
    EXPECT_FALSE(monitor->poll_once());
    EXPECT_TRUE(triggers.empty());
}

TEST_F(CrashMonitorTest, DeviceListCanChange) {
    auto monitor = make_monitor({});
    transport.respond("dev9", COREDUMP_LIST_CMD, ShellResult::ok("core.z.1\n"));
    EXPECT_FALSE(monitor->poll_once());

    monitor->update_devices({"dev9"});
    EXPECT_TRUE(monitor->poll_once());
}

TEST_F(CrashMonitorTest, BackgroundThreadStartsAndStops) {
    std::atomic<int> fired{0};
    CrashMonitorConfig config;
    config.interval_ms = 100;
    CrashMonitor monitor(transport, config,
                         [&](const std::string&, const std::vector<std::string>&) { ++fired; });
    monitor.update_devices({"dev1"});
    transport.respond("dev1", COREDUMP_LIST_CMD, ShellResult::ok("core.a.1\n"));

    EXPECT_TRUE(monitor.start());
    EXPECT_TRUE(monitor.running());
    for (int i = 0; i < 100 && fired == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    monitor.stop();
    EXPECT_FALSE(monitor.running());
    EXPECT_EQ(fired, 1);
}
