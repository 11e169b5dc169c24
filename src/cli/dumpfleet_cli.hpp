#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_dump_commands(BaseCLI& cli);
void register_monitor_commands(BaseCLI& cli);
void register_config_commands(BaseCLI& cli);

class DumpfleetCLI : public BaseCLI {
public:
    DumpfleetCLI();

    void run_repl();

    // One-shot entry points for main(). Return the process exit code.
    int run_dump(const std::vector<std::string>& args);
    int run_show(const std::string& issue_dir);
    int run_monitor();
    int run_setup();

private:
    void register_all_commands();
};
