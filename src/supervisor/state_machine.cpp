#include "supervisor/state_machine.hpp"

#include <array>
#include <cstddef>

namespace syncwarden {

namespace {

constexpr std::size_t kStateCount = 5;

constexpr TransitionOutcome I = TransitionOutcome::Ignore;
constexpr TransitionOutcome A = TransitionOutcome::Apply;
constexpr TransitionOutcome X = TransitionOutcome::ApplyAndAbort;

// Rows: current state. Columns: requested state.
// Order: Stopped, Starting, Running, Stopping, Restarting.
//
// Stopped -> Running is rejected: a failed launch (port or database held by
// another instance) is seen as Stopped, and the late "ready" of that attempt
// must not promote it to Running.
constexpr std::array<std::array<TransitionOutcome, kStateCount>, kStateCount> kTransitions = {{
    /* Stopped    */ {{I, A, I, A, A}},
    /* Starting   */ {{X, I, A, A, A}},
    /* Running    */ {{X, X, I, X, X}},
    /* Stopping   */ {{A, A, A, I, A}},
    /* Restarting */ {{A, A, A, A, I}},
}};

constexpr std::size_t indexOf(SupervisorState state)
{
    return static_cast<std::size_t>(state);
}

} // namespace

TransitionOutcome evaluateTransition(SupervisorState current, SupervisorState requested)
{
    return kTransitions[indexOf(current)][indexOf(requested)];
}

} // namespace syncwarden
