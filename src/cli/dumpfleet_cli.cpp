#include "dumpfleet_cli.hpp"
#include "theme.hpp"
#include "commands/dump_helpers.hpp"
#include <iostream>
#include <sstream>
#include <fstream>
#include <filesystem>
#include <csignal>
#include <optional>
#include <pthread.h>
#include <cstdlib>
#include <core/config.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <readline/readline.h>
#include <readline/history.h>

namespace fs = std::filesystem;

DumpfleetCLI::DumpfleetCLI() : BaseCLI() {
    register_all_commands();
}

void DumpfleetCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [](BaseCLI& cli, const std::string& arg) {
        std::cout << theme::dim("Stopping...") << "\n";
        cli.clear_fleet();
        exit(0);
    }, "Exit dumpfleet");

    add_command("exit", [](BaseCLI& cli, const std::string& arg) {
        std::cout << theme::dim("Stopping...") << "\n";
        cli.clear_fleet();
        exit(0);
    }, "Exit dumpfleet");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_dump_commands(*this);
    register_monitor_commands(*this);
    register_config_commands(*this);
}

void DumpfleetCLI::run_repl() {
    std::cout << theme::banner();

    if (!config_exists()) {
        std::cout << theme::info("No config at " + get_config_path().string() + ", using defaults.");
        std::cout << theme::step("Run 'dumpfleet setup' to write one.");
    }
    if (!require_config()) {
        std::cout << "\n";
        return;
    }
    init_fleet();

    std::cout << theme::section("Fleet");
    std::cout << theme::kv("Devices", config->devices().empty() ? theme::dim("(none configured)")
                                                               : join(config->devices(), ", "));
    std::cout << theme::kv("Logs", config->fleet().log_directory.string());
    std::cout << theme::kv("Layout", config->fleet().path_strategy);

    if (config->crash_monitor().enabled && start_monitor()) {
        std::cout << theme::kv("Monitor", theme::green("on"));
    }
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (true) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        trim(args);

        execute_command(command, args);
    }

    std::cout << "\n";
    clear_fleet();
}

int DumpfleetCLI::run_dump(const std::vector<std::string>& args) {
    auto parsed = parse_dump_args(args);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        std::cout << theme::step("Usage: dumpfleet dump [--headless] [--upload|--no-upload] [--strategy S] [device...]");
        return 2;
    }
    if (!require_config()) return 1;

    execute_command("dump", join(args, " "));

    if (!last_summary) return 1;
    return last_summary->fail_count == 0 && last_summary->success_count > 0 ? 0 : 1;
}

int DumpfleetCLI::run_show(const std::string& issue_dir) {
    auto root = find_issue_root(expand_user(issue_dir));
    if (!root) {
        std::cout << theme::fail("No manifest found at " + issue_dir);
        return 1;
    }
    auto loaded = ManifestStore(*root).load();
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        return 1;
    }
    print_manifest(loaded.value);
    return 0;
}

int DumpfleetCLI::run_monitor() {
    // Block the stop signals before any worker thread exists so they all
    // inherit the mask and sigwait below is the only receiver
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    if (!start_monitor()) return 1;

    std::cout << theme::section("Crash monitor");
    std::cout << theme::kv("Devices", join(config->devices(), ", "));
    std::cout << theme::kv("Interval", std::to_string(config->crash_monitor().interval_ms) + " ms");
    std::cout << theme::dim("    Ctrl-C to stop.") << "\n\n";

    int sig = 0;
    sigwait(&set, &sig);

    std::cout << "\n" << theme::dim("Stopping...") << "\n";
    clear_fleet();
    return 0;
}

// First match wins: beside the binary (build tree), then the install layout
static std::optional<fs::path> find_bundled_script() {
    fs::path exe_dir = platform::executable_dir();
    if (exe_dir.empty()) return std::nullopt;
    const fs::path candidates[] = {
        exe_dir / "coredump_extraction.sh",
        exe_dir / ".." / "share" / "dumpfleet" / "coredump_extraction.sh",
        exe_dir / ".." / "scripts" / "coredump_extraction.sh",
    };
    std::error_code ec;
    for (const auto& c : candidates) {
        if (fs::is_regular_file(c, ec)) return c;
    }
    return std::nullopt;
}

int DumpfleetCLI::run_setup() {
    std::cout << theme::banner();
    std::cout << theme::section("Setup");

    bool existed = config_exists();
    auto created = create_default_config();
    if (created.is_err()) {
        std::cout << theme::fail("Failed to create config file: " + created.error);
        return 1;
    }
    std::cout << (existed ? theme::info(get_config_path().string() + " (exists)")
                          : theme::ok(get_config_path().string()));

    fs::path script = default_script_path();
    std::error_code ec;
    if (fs::exists(script, ec)) {
        std::cout << theme::info(script.string() + " (exists)");
    } else {
        auto bundled = find_bundled_script();
        if (!bundled) {
            std::cout << theme::fail("Bundled coredump_extraction.sh not found next to the binary.");
            std::cout << theme::step("Copy it to " + script.string() + " by hand.");
            return 1;
        }
        fs::copy_file(*bundled, script, ec);
        if (!ec) {
            fs::permissions(script, fs::perms::owner_exec | fs::perms::group_exec,
                            fs::perm_options::add, ec);
        }
        if (ec) {
            std::cout << theme::fail("Failed to install script: " + ec.message());
            return 1;
        }
        std::cout << theme::ok(script.string());
    }

    std::cout << theme::divider();
    std::cout << theme::section("Next Steps");
    std::cout << "    " << theme::white("1.") << " List your device serials under 'devices:' in the config\n";
    std::cout << "    " << theme::white("2.") << " Run 'jf c add' once if uploads should reach Artifactory\n";
    std::cout << "    " << theme::white("3.") << " Run 'dumpfleet dump' or start the REPL with 'dumpfleet'\n\n";
    return 0;
}
