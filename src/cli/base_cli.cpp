#include "base_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <fmt/format.h>
#include <readline/readline.h>

static std::atomic<bool> g_interrupted{false};

static void on_sigint(int) {
    g_interrupted = true;
}

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        config_error = config_result.error;
    }
}

BaseCLI::~BaseCLI() {
    clear_fleet();
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail("Configuration could not be loaded: " + config_error);
        std::cout << theme::step("Fix " + get_config_path().string() + " or run 'dumpfleet setup'.");
        return false;
    }
    return true;
}

bool BaseCLI::require_fleet() {
    if (!require_config()) {
        return false;
    }
    if (!fleet) {
        init_fleet();
    }
    return fleet != nullptr;
}

void BaseCLI::init_fleet() {
    if (!config || fleet) return;

    transport = std::make_unique<AdbTransport>();
    runner = std::make_unique<ScriptProcessRunner>();
    uploader = std::make_unique<JFrogUploader>(config->artifact_store());
    prompter = std::make_unique<TerminalPrompter>(assume_yes);
    fleet = std::make_unique<FleetDumpCoordinator>(config->fleet(), *runner, *transport,
                                                   uploader.get(), prompter.get(),
                                                   make_callbacks());
    fleet->start();
}

void BaseCLI::clear_fleet() {
    // Monitor and coordinator hold references into the rest
    stop_monitor();
    monitor.reset();
    if (fleet) fleet->stop();
    fleet.reset();
    prompter.reset();
    uploader.reset();
    runner.reset();
    transport.reset();
}

// ── Fleet callbacks (coordinator thread) ────────────────────

FleetCallbacks BaseCLI::make_callbacks() {
    FleetCallbacks cb;

    cb.on_device_event = [](const DumpEvent& ev) {
        if (ev.kind != DumpEvent::Kind::StatusChanged) return;
        if (ev.new_state == DumpState::Idle) return;
        std::cout << theme::log(fmt::format("{} {}", ev.device_id, to_string(ev.new_state)));
    };

    cb.on_progress = [](const std::string& issue_id, int completed, int total) {
        std::cout << theme::info(fmt::format("{}: {}/{} devices done", issue_id, completed, total));
    };

    cb.on_completed = [this](const FleetSummary& summary) {
        ManifestStore store(summary.issue_root);
        auto loaded = store.load();
        std::cout << theme::section("Issue " + summary.issue_id + " finished");
        if (loaded.is_ok()) {
            for (const auto& [device, r] : loaded.value.results) {
                if (r.success) {
                    std::cout << theme::ok(device + ": " + r.detail);
                } else if (r.error == DumpErrorKind::Cancelled) {
                    std::cout << theme::info(device + ": " + r.detail);
                } else {
                    std::cout << theme::fail(device + ": " + r.detail);
                }
            }
        }
        std::cout << theme::kv("Succeeded", std::to_string(summary.success_count));
        std::cout << theme::kv("Failed", std::to_string(summary.fail_count));
        std::cout << theme::kv("Cancelled", std::to_string(summary.cancelled_count));
        std::cout << theme::kv("Directory", summary.issue_root.string()) << "\n";

        last_summary = summary;
        request_settled_ = true;
    };

    cb.on_error = [this](const std::string& message) {
        std::cout << theme::fail(message);
        request_rejected_ = true;
        request_settled_ = true;
    };

    cb.on_upload = [](const std::string& issue_id, const UploadRecord& record) {
        if (record.success) {
            std::cout << theme::ok(issue_id + ": " + record.message);
            auto url = record.upload_info.find("url");
            if (url != record.upload_info.end()) {
                std::cout << theme::kv("URL", url->second);
            }
        } else {
            std::cout << theme::fail(issue_id + ": " + record.message);
        }
    };

    return cb;
}

// ── Requests ────────────────────────────────────────────────

bool BaseCLI::run_request(DumpTrigger trigger, std::vector<std::string> devices,
                          DumpRequestOptions options) {
    if (!require_fleet()) return false;

    request_settled_ = false;
    request_rejected_ = false;
    last_summary.reset();
    fleet->request(trigger, std::move(devices), std::move(options));

    struct sigaction sa = {};
    struct sigaction old_sa = {};
    sa.sa_handler = on_sigint;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, &old_sa);
    g_interrupted = false;

    std::cout << theme::dim("    Waiting for dumps. Ctrl-C to cancel a device.") << "\n";
    while (true) {
        if (g_interrupted.exchange(false)) {
            offer_cancel();
        }
        if (request_settled_) {
            if (fleet->wait_until_idle(std::chrono::milliseconds(200))) break;
        } else {
            platform::sleep_ms(100);
        }
    }

    sigaction(SIGINT, &old_sa, nullptr);
    return !request_rejected_;
}

void BaseCLI::offer_cancel() {
    auto status = fleet->status();
    std::vector<std::string> cancellable;
    for (const auto& [device, ds] : status.devices) {
        if (ds.state == DumpState::Extracting && ds.mode == DumpMode::Interactive) {
            cancellable.push_back(device);
        }
    }

    std::cout << "\n";
    if (cancellable.empty()) {
        std::cout << theme::info("Nothing to cancel. Headless dumps run until they finish or time out.");
        return;
    }

    std::string device = cancellable.front();
    if (cancellable.size() > 1) {
        for (const auto& d : cancellable) std::cout << theme::step(d);
        char* raw = readline("    Device to cancel: ");
        if (!raw) return;
        device = raw;
        free(raw);
        trim(device);
        if (device.empty()) return;
    }

    if (fleet->cancel_device(device)) {
        std::cout << theme::info("Cancelling " + device + "...");
    }
}

// ── Crash monitor ───────────────────────────────────────────

bool BaseCLI::start_monitor() {
    if (!require_fleet()) return false;
    if (config->devices().empty()) {
        std::cout << theme::fail("No devices configured to monitor.");
        std::cout << theme::step("Add serials under 'devices:' in " + get_config_path().string());
        return false;
    }
    if (monitor_running()) return true;

    auto devices = config->devices();
    monitor = std::make_unique<CrashMonitor>(
        *transport, config->crash_monitor(),
        [this, devices](const std::string& device, const std::vector<std::string>& coredumps) {
            std::cout << "\n" << theme::warn(fmt::format("{} new coredump(s) on {}",
                                                         coredumps.size(), device));
            DumpRequestOptions options;
            options.request_device_id = device;
            fleet->request(DumpTrigger::CrashMonitor, devices, options);
        },
        [this]() { return fleet->is_active(); });
    monitor->update_devices(devices);
    return monitor->start();
}

void BaseCLI::stop_monitor() {
    if (monitor) monitor->stop();
}

// ── Dispatch ────────────────────────────────────────────────

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Dumps",   {"dump", "cancel", "status", "show"}},
        {"Monitor", {"monitor"}},
        {"Setup",   {"config"}},
        {"General", {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::BROWN) + "dumpfleet" + rl_esc(theme::color::RESET);
    if (fleet && fleet->is_active()) {
        prompt += ":" + rl_esc(theme::color::YELLOW) + "busy" + rl_esc(theme::color::RESET);
    }
    if (monitor_running()) {
        prompt += "@" + rl_esc(theme::color::GREEN) + "monitor" + rl_esc(theme::color::RESET);
    }
    return prompt + "> ";
}
