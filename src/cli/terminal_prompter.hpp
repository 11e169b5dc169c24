#pragma once

#include <mutex>
#include <string>
#include <managers/dump_prompter.hpp>

// y/N questions on the controlling terminal through readline. Prompts
// from different threads are serialized.
class TerminalPrompter : public DumpPrompter {
public:
    // With assume_yes every question is answered "yes" without asking
    // (used for non-interactive one-shot runs).
    explicit TerminalPrompter(bool assume_yes = false);

    CancelDecision confirm_cancel(const std::string& device_id) override;
    bool confirm_upload(const std::filesystem::path& issue_root,
                        const std::string& remote_path) override;
    void show_completion(const DumpOutcome& outcome) override;

private:
    bool ask(const std::string& question);

    bool assume_yes_;
    std::mutex mutex_;
};
