#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <iostream>
#include <fmt/format.h>

static void do_monitor(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) return;

    if (arg == "on") {
        if (cli.monitor_running()) {
            std::cout << theme::info("Crash monitor already running.");
            return;
        }
        if (cli.start_monitor()) {
            std::cout << theme::ok(fmt::format("Watching {} device(s) every {} ms",
                                               cli.config->devices().size(),
                                               cli.config->crash_monitor().interval_ms));
        }
    } else if (arg == "off") {
        cli.stop_monitor();
        std::cout << theme::ok("Crash monitor stopped.");
    } else if (arg.empty()) {
        std::cout << theme::kv("Monitor", cli.monitor_running() ? theme::green("on") : theme::dim("off"));
        std::cout << theme::kv("Devices", join(cli.config->devices(), ", "));
    } else {
        std::cout << theme::fail("Usage: monitor [on|off]");
    }
}

void register_monitor_commands(BaseCLI& cli) {
    cli.add_command("monitor", do_monitor, "Watch devices for new coredumps (on|off)");
}
