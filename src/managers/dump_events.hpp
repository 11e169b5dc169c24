#pragma once

#include <string>
#include <functional>
#include <core/dump_types.hpp>

// Message a DumpJob sends to its owner.
struct DumpEvent {
    enum class Kind { StatusChanged, Progress, Finished };

    Kind kind = Kind::Progress;
    std::string device_id;
    DumpTrigger trigger = DumpTrigger::Manual;
    DumpState old_state = DumpState::Idle;   // StatusChanged
    DumpState new_state = DumpState::Idle;   // StatusChanged
    std::string message;                     // Progress
    DumpOutcome outcome;                     // Finished
};

// Called from the job's worker thread. Must not block.
using DumpEventSink = std::function<void(const DumpEvent&)>;
