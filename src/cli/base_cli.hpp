#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <atomic>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <device/adb_transport.hpp>
#include <managers/process_runner.hpp>
#include <managers/upload_pipeline.hpp>
#include <managers/fleet_coordinator.hpp>
#include <managers/crash_monitor.hpp>
#include "terminal_prompter.hpp"

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI();

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool require_config();
    bool require_fleet();

    // Build transport, runner, uploader and coordinator from the config and
    // start the coordinator loop.
    void init_fleet();
    void clear_fleet();

    // Submit a request and block until it (and its upload) is done. Ctrl-C
    // while waiting offers to cancel an interactive device. Returns false
    // if the request was rejected.
    bool run_request(DumpTrigger trigger, std::vector<std::string> devices,
                     DumpRequestOptions options);

    bool start_monitor();
    void stop_monitor();
    bool monitor_running() const { return monitor && monitor->running(); }

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Public state
    std::optional<Config> config;
    std::string config_error;
    bool assume_yes = false;
    std::unique_ptr<AdbTransport> transport;
    std::unique_ptr<ScriptProcessRunner> runner;
    std::unique_ptr<JFrogUploader> uploader;
    std::unique_ptr<TerminalPrompter> prompter;
    std::unique_ptr<FleetDumpCoordinator> fleet;
    std::unique_ptr<CrashMonitor> monitor;

    // Outcome of the last request run through run_request
    std::optional<FleetSummary> last_summary;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    FleetCallbacks make_callbacks();
    void offer_cancel();

    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
    std::atomic<bool> request_settled_{true};
    std::atomic<bool> request_rejected_{false};
};
