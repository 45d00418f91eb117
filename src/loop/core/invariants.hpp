#pragma once

/**
 * @file invariants.hpp
 * @brief Debug assertions for session and action invariants
 *
 * Enabled in debug builds, compiled out in release.
 *
 * Key invariants:
 * 1. An action carries a cycle payload iff its direction is Cycle
 * 2. A custom payload only appears on Custom or Stash actions
 * 3. An inactive session has no current action, parent cycle or frame state
 * 4. The current action of a session is never a Cycle
 */

#include "loop/core/action.hpp"
#include "loop/core/log.hpp"
#include "loop/core/resolver.hpp"
#include <optional>

namespace loop::invariants {

#ifdef NDEBUG
// Release build: no-op
#    define LOOP_ASSERT_ACTION_PAYLOAD(action)
#    define LOOP_ASSERT_SESSION_STATE(...)
#else

/**
 * @brief Assert that an action's payload matches its direction
 *
 * Recurses into cycle members.
 */
inline void assert_action_payload(Action const& action)
{
    bool is_cycle = action.direction == Direction::Cycle;
    if (is_cycle != (action.cycle_members() != nullptr))
    {
        LOG_ERROR(
            "INVARIANT VIOLATION: Action {} has {} cycle payload",
            action.display_name(),
            is_cycle ? "no" : "a"
        );
    }

    if (action.custom() && !is_customizable(action.direction))
        LOG_ERROR("INVARIANT VIOLATION: Action {} carries a custom frame", action.display_name());

    if (auto const* members = action.cycle_members())
    {
        for (auto const& member : *members)
            assert_action_payload(member);
    }
}

/**
 * @brief Assert session state consistency
 *
 * Verifies:
 * - Active sessions never hold a Cycle as the current action
 * - Inactive sessions were fully reset
 */
inline void assert_session_state(
    bool active,
    Action const& current,
    std::optional<Action> const& parent_cycle,
    FrameState const& frame_state
)
{
    if (current.direction == Direction::Cycle)
        LOG_ERROR("INVARIANT VIOLATION: Current action is a cycle");

    if (active)
        return;

    if (current.direction != Direction::NoAction)
        LOG_ERROR("INVARIANT VIOLATION: Inactive session has current action {}", current.display_name());
    if (parent_cycle)
        LOG_ERROR("INVARIANT VIOLATION: Inactive session has parent cycle {}", parent_cycle->display_name());
    if (frame_state.sides_to_adjust || frame_state.last_target_frame != Rect{})
        LOG_ERROR("INVARIANT VIOLATION: Inactive session kept its frame state");
}

#    define LOOP_ASSERT_ACTION_PAYLOAD(action)                                                                       \
        do                                                                                                           \
        {                                                                                                            \
            ::loop::invariants::assert_action_payload(action);                                                       \
        } while (0)

#    define LOOP_ASSERT_SESSION_STATE(active, current, parent, frame_state)                                          \
        do                                                                                                           \
        {                                                                                                            \
            ::loop::invariants::assert_session_state(active, current, parent, frame_state);                          \
        } while (0)

#endif

} // namespace loop::invariants
