#include "terminal_prompter.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <iostream>
#include <cstdlib>
#include <algorithm>
#include <readline/readline.h>

TerminalPrompter::TerminalPrompter(bool assume_yes) : assume_yes_(assume_yes) {}

// Anything but an explicit yes is a no, EOF included
bool TerminalPrompter::ask(const std::string& question) {
    if (assume_yes_) return true;

    std::string prompt = "\001" + theme::color::BROWN + "\002    " + question + " [y/N] "
                       + "\001" + theme::color::RESET + "\002";
    char* raw = readline(prompt.c_str());
    if (!raw) {
        std::cout << "\n";
        return false;
    }
    std::string answer = raw;
    free(raw);

    trim(answer);
    std::transform(answer.begin(), answer.end(), answer.begin(), ::tolower);
    return answer == "y" || answer == "yes";
}

CancelDecision TerminalPrompter::confirm_cancel(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    CancelDecision decision;

    std::cout << "\n" << theme::warn("Dump extraction on " + device_id + " is still running.");
    decision.confirmed = ask("Cancel it?");
    if (!decision.confirmed) return decision;

    decision.cleanup = ask("Also delete the coredumps left on the device?");
    return decision;
}

bool TerminalPrompter::confirm_upload(const std::filesystem::path& issue_root,
                                      const std::string& remote_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "\n" << theme::section("Upload");
    std::cout << theme::kv("Local", issue_root.string());
    std::cout << theme::kv("Remote", remote_path);
    return ask("Upload this issue to the artifact store?");
}

void TerminalPrompter::show_completion(const DumpOutcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outcome.success()) {
        std::cout << theme::ok(outcome.device_id + ": " + outcome.detail);
        std::cout << theme::dim("      " + outcome.dump_path.string()) << "\n";
    } else if (outcome.cancelled()) {
        std::cout << theme::info(outcome.device_id + ": " + outcome.detail);
    } else {
        std::cout << theme::fail(outcome.device_id + ": " + outcome.detail);
    }
}
