#include <lolite/core/lifecycle.h>

namespace lolite::core {

const char* run_state_name(RunState state) {
    switch (state) {
        case RunState::Idle:      return "idle";
        case RunState::Running:   return "running";
        case RunState::Stopped:   return "stopped";
        case RunState::Destroyed: return "destroyed";
    }
    return "unknown";
}

bool is_valid_transition(RunState from, RunState to) {
    switch (from) {
        case RunState::Idle:
            return to == RunState::Running || to == RunState::Destroyed;
        case RunState::Running:
            return to == RunState::Stopped || to == RunState::Destroyed;
        case RunState::Stopped:
            return to == RunState::Running || to == RunState::Destroyed;
        case RunState::Destroyed:
            return false;
    }
    return false;
}

}  // namespace lolite::core
