#include "../base_cli.hpp"
#include "../theme.hpp"
#include "dump_helpers.hpp"
#include <core/utils.hpp>
#include <iostream>
#include <fmt/format.h>

static void do_dump(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_fleet()) return;

    auto parsed = parse_dump_args(split_args(arg));
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        std::cout << theme::step("Usage: dump [--headless] [--upload|--no-upload] [--strategy S] [device...]");
        return;
    }
    const auto& args = parsed.value;

    auto devices = args.devices.empty() ? cli.config->devices() : args.devices;
    if (devices.empty()) {
        std::cout << theme::fail("No devices given and none configured.");
        std::cout << theme::step("Name serials on the command line or under 'devices:' in the config.");
        return;
    }

    DumpRequestOptions options;
    options.upload_enabled = args.upload;
    if (args.headless) options.mode = DumpMode::Headless;

    // Strategy override for this request only; settings apply to the next
    // request, so restore right behind it
    const FleetSettings configured = cli.config->fleet();
    if (!args.strategy.empty() && args.strategy != configured.path_strategy) {
        FleetSettings once = configured;
        once.path_strategy = args.strategy;
        cli.fleet->update_settings(once);
    }

    std::cout << theme::section("Dump");
    std::cout << theme::kv("Devices", join(devices, ", "));
    std::cout << theme::kv("Mode", to_string(args.headless ? DumpMode::Headless
                                                          : cli.config->mode_for(DumpTrigger::Manual)));
    std::cout << "\n";

    bool accepted = cli.run_request(DumpTrigger::Manual, devices, options);
    if (!args.strategy.empty() && args.strategy != configured.path_strategy) {
        cli.fleet->update_settings(configured);
    }
    if (!accepted) {
        std::cout << theme::step("Wait for the running request to finish, then retry.");
    }
}

static void do_cancel(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_fleet()) return;
    if (arg.empty()) {
        std::cout << theme::fail("Usage: cancel <device>");
        return;
    }

    auto status = cli.fleet->status();
    auto it = status.devices.find(arg);
    if (!status.active || it == status.devices.end()) {
        std::cout << theme::fail("No dump running on " + arg);
        return;
    }
    if (it->second.mode == DumpMode::Headless) {
        std::cout << theme::fail(arg + " runs headless and cannot be cancelled.");
        return;
    }
    if (it->second.state != DumpState::Extracting) {
        std::cout << theme::fail(fmt::format("{} is {}, only extracting dumps can be cancelled.",
                                             arg, to_string(it->second.state)));
        return;
    }

    if (cli.fleet->cancel_device(arg)) {
        std::cout << theme::info("Cancelling " + arg + "...");
    } else {
        std::cout << theme::dim("    Dump left running.") << "\n";
    }
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) return;

    std::cout << theme::section("Status");
    std::cout << theme::kv("Monitor", cli.monitor_running() ? theme::green("on") : theme::dim("off"));
    if (!cli.fleet) {
        std::cout << theme::kv("Fleet", theme::dim("idle")) << "\n";
        return;
    }

    auto s = cli.fleet->status();
    if (!s.active) {
        std::cout << theme::kv("Fleet", theme::dim("idle"));
        if (s.uploads_pending > 0) {
            std::cout << theme::kv("Uploads", std::to_string(s.uploads_pending) + " pending");
        }
        std::cout << "\n";
        return;
    }

    std::cout << theme::kv("Issue", s.issue_id);
    std::cout << theme::kv("Trigger", to_string(s.trigger));
    std::cout << theme::kv("Progress", fmt::format("{}/{} ({} running, {} queued)",
                                                   s.completed, s.total, s.inflight,
                                                   s.pending.size()));
    std::cout << theme::kv("Directory", s.issue_root.string());
    std::cout << "\n";

    for (const auto& [device, ds] : s.devices) {
        std::cout << fmt::format("    {:<20} ", device)
                  << theme::state(to_string(ds.state)) << "  "
                  << theme::dim(ds.last_message) << "\n";
    }
    std::cout << "\n";
}

static void do_show(BaseCLI& cli, const std::string& arg) {
    if (arg.empty()) {
        std::cout << theme::fail("Usage: show <issue_dir>");
        return;
    }

    auto root = find_issue_root(expand_user(arg));
    if (!root) {
        std::cout << theme::fail("No manifest found at " + arg);
        return;
    }

    auto loaded = ManifestStore(*root).load();
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        return;
    }
    print_manifest(loaded.value);
}

void register_dump_commands(BaseCLI& cli) {
    cli.add_command("dump", do_dump, "Extract coredumps from devices");
    cli.add_command("cancel", do_cancel, "Cancel an interactive dump");
    cli.add_command("status", do_status, "Show fleet progress");
    cli.add_command("show", do_show, "Show a finished issue");
}
