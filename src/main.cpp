#include <iostream>
#include <vector>
#include <string>
#include "cli/dumpfleet_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    dumpfleet"
              << theme::color::RESET << theme::color::DIM
              << "                       Interactive prompt" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    dumpfleet dump "
              << theme::color::RESET << theme::color::BROWN << "[device...]"
              << theme::color::RESET << theme::color::DIM
              << "      Extract coredumps now" << theme::color::RESET << "\n";
    std::cout << theme::color::DIM
              << "        --headless                No prompts, shorter timeout\n"
              << "        --upload / --no-upload    Override upload.enabled\n"
              << "        --strategy S              unified, individual or hybrid"
              << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    dumpfleet show "
              << theme::color::RESET << theme::color::BROWN << "<issue_dir>"
              << theme::color::RESET << theme::color::DIM
              << "      Show an issue manifest" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    dumpfleet monitor"
              << theme::color::RESET << theme::color::DIM
              << "               Dump the fleet when a device crashes" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    dumpfleet setup"
              << theme::color::RESET << theme::color::DIM
              << "                 Write default config and script" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    dumpfleet --version             Show version\n"
              << "    dumpfleet --help                Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        DumpfleetCLI cli;

        if (argc == 1) {
            cli.run_repl();
            return 0;
        }

        std::string cmd = argv[1];
        std::vector<std::string> rest(argv + 2, argv + argc);

        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "dumpfleet"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << DUMPFLEET_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "dump") {
            return cli.run_dump(rest);
        } else if (cmd == "show") {
            if (rest.empty()) {
                std::cout << theme::fail("Missing issue directory.");
                std::cout << theme::step("Usage: dumpfleet show <issue_dir>");
                return 1;
            }
            return cli.run_show(rest[0]);
        } else if (cmd == "monitor") {
            return cli.run_monitor();
        } else if (cmd == "setup") {
            return cli.run_setup();
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
