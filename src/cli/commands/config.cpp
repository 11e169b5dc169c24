#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <iostream>
#include <fmt/format.h>

static void show_config(const Config& config) {
    const auto& f = config.fleet();
    const auto& store = config.artifact_store();

    std::cout << theme::section("Config");
    std::cout << theme::kv("File", get_config_path().string());
    std::cout << theme::kv("Logs", f.log_directory.string());
    std::cout << theme::kv("Script", f.script_path.string());
    std::cout << theme::kv("Devices", config.devices().empty() ? theme::dim("(none)")
                                                              : join(config.devices(), ", "));

    std::cout << theme::section("Dump");
    std::cout << theme::kv("Parallel", std::to_string(f.max_concurrency));
    std::cout << theme::kv("Layout", f.path_strategy + " (" + f.directory_prefix + ")");
    std::cout << theme::kv("Manual", to_string(f.manual_mode));
    std::cout << theme::kv("Automated", to_string(f.automated_mode));
    std::cout << theme::kv("Timeouts", fmt::format("headless {}s, interactive {}s, grace {}s",
                                                   f.timeouts.headless_secs,
                                                   f.timeouts.interactive_secs,
                                                   f.timeouts.cancel_grace_secs));

    std::cout << theme::section("Upload");
    std::cout << theme::kv("Enabled", f.upload_enabled ? "yes" : "no");
    std::cout << theme::kv("Server", store.server_url);
    std::cout << theme::kv("Repository", store.repository);
    std::cout << theme::kv("Remote", f.upload_prefix + "/<issue_id>");
    std::cout << "\n";
}

static void do_config(BaseCLI& cli, const std::string& arg) {
    if (arg == "reload") {
        auto loaded = Config::load();
        if (loaded.is_err()) {
            std::cout << theme::fail(loaded.error);
            return;
        }
        cli.config = loaded.value;
        cli.config_error.clear();
        if (cli.fleet) cli.fleet->update_settings(cli.config->fleet());
        if (cli.monitor) cli.monitor->update_devices(cli.config->devices());
        std::cout << theme::ok("Config reloaded. Layout changes apply to the next request.");
        return;
    }
    if (arg.rfind("parallel", 0) == 0) {
        if (!cli.require_config()) return;
        std::string value = arg.substr(8);
        trim(value);
        int n = safe_stoi(value, 0);
        if (n < 1) {
            std::cout << theme::fail("Usage: config parallel <N>  (N >= 1)");
            return;
        }
        cli.config->set_max_concurrency(n);
        if (cli.fleet) cli.fleet->update_settings(cli.config->fleet());
        std::cout << theme::ok(fmt::format("Up to {} devices at once", n));
        return;
    }
    if (!arg.empty()) {
        std::cout << theme::fail("Usage: config [reload | parallel <N>]");
        return;
    }
    if (!cli.require_config()) return;
    show_config(*cli.config);
}

void register_config_commands(BaseCLI& cli) {
    cli.add_command("config", do_config, "Show settings, 'config reload' or 'config parallel N'");
}
