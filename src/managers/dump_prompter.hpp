#pragma once

#include <string>
#include <filesystem>
#include <core/dump_types.hpp>

struct CancelDecision {
    bool confirmed = false;
    bool cleanup = false;   // also wipe crash artifacts on the device
};

// Operator interaction for interactive dumps. Implementations block until
// the operator answers.
class DumpPrompter {
public:
    virtual ~DumpPrompter() = default;

    // Two-stage confirmation: cancel at all, then whether to clean up the
    // device's crash artifacts afterwards.
    virtual CancelDecision confirm_cancel(const std::string& device_id) = 0;

    virtual bool confirm_upload(const std::filesystem::path& issue_root,
                                const std::string& remote_path) = 0;

    virtual void show_completion(const DumpOutcome& outcome) = 0;
};
