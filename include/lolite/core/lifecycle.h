#pragma once

#include <cstdint>

namespace lolite::core {

// Run-state of an engine instance:
//   Idle -> Running -> {Stopped, Destroyed}, Stopped -> Running.
// Nothing leaves Destroyed.
enum class RunState : std::uint8_t {
    Idle,
    Running,
    Stopped,
    Destroyed,
};

const char* run_state_name(RunState state);

bool is_valid_transition(RunState from, RunState to);

}  // namespace lolite::core
