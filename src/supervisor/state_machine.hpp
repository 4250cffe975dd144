#pragma once

#include "common/enums.hpp"

namespace syncwarden {

enum class TransitionOutcome {
    // Request dropped; state unchanged, nothing published.
    Ignore,
    Apply,
    // Apply, then cancel the connection attempt and dispose API client and watchers.
    ApplyAndAbort
};

// Transition policy of the supervisor lifecycle (current x requested).
TransitionOutcome evaluateTransition(SupervisorState current, SupervisorState requested);

} // namespace syncwarden
