#include "session_controller.hpp"
#include "loop/core/geometry.hpp"
#include "loop/core/invariants.hpp"
#include "loop/core/log.hpp"
#include "loop/core/policy.hpp"
#include "loop/core/screen.hpp"
#include "loop/engine/window_engine.hpp"
#include "loop/stash/stash_manager.hpp"
#include <X11/keysym.h>
#include <algorithm>

namespace loop {

namespace {

constexpr uint8_t LEFT_BUTTON = 1;

bool is_excluded(std::vector<std::string> const& excluded, std::string const& app_class)
{
    return std::find(excluded.begin(), excluded.end(), app_class) != excluded.end();
}

} // namespace

SessionController::SessionController(
    Config const& config,
    WindowSystem& windows,
    WindowEngine& engine,
    StashManager& stash,
    WindowHistory& history,
    PointerEvents& pointer_events,
    StateFile& state
)
    : config_(config)
    , windows_(windows)
    , engine_(engine)
    , stash_(stash)
    , history_(history)
    , pointer_events_(pointer_events)
    , state_(state)
{
}

// ─────────────────────────────────────────────────────────────────────────────
// Opening and closing
// ─────────────────────────────────────────────────────────────────────────────

void SessionController::open(std::optional<Action> const& starting)
{
    if (active_)
    {
        // Chords can arrive as separate events; a later part only refines the action
        if (starting)
            change_action(*starting);
        return;
    }

    WindowPtr target = choose_target_window();
    if (target)
    {
        if (is_excluded(config_.behavior.excluded_apps, target->app_class()))
        {
            LOG_DEBUG("Not opening: {} is excluded", target->app_class());
            return;
        }
        if (config_.behavior.ignore_fullscreen && target->fullscreen())
        {
            LOG_DEBUG("Not opening: target window is fullscreen");
            return;
        }
        if (!config_.geometry.preview_visibility && !history_.has_been_recorded(target->id()))
            history_.record_first(target->id(), target->frame());
    }

    target_ = std::move(target);
    current_ = make_action(Direction::NoAction);
    parent_cycle_.reset();
    initial_pointer_ = windows_.cursor_position();
    pointer_angle_ = 0;
    pointer_distance_ = 0;
    screen_ = choose_screen();
    shift_pressed_ = false;
    preview_frame_.reset();

    if (!config_.behavior.disable_cursor_interaction)
        pointer_subscription_ = pointer_events_.subscribe([this](PointerEvent const& event) { on_pointer(event); });

    if (target_)
    {
        // A stashed window resizes from where it shows when revealed
        auto revealed = stash_.revealed_frame_for(target_->id());
        frame_state_.last_target_frame = revealed ? *revealed : target_->frame();
    }

    active_ = true;
    LOG_INFO("Session opened on {} (window {:#x})", screen_->name, target_ ? target_->id() : 0);
    if (hooks_.active_changed)
        hooks_.active_changed(true);

    if (starting)
        change_action(*starting);
}

void SessionController::close(bool force)
{
    if (!active_)
        return;

    pointer_subscription_.reset();

    if (target_ && screen_ && !force && current_.direction != Direction::NoAction)
    {
        if (config_.geometry.preview_visibility)
            engine_.apply(target_, current_, *screen_, frame_state_);
        else
            history_.record(target_->id(), target_->frame(), current_);

        state_.increment_times_looped();
    }

    LOG_INFO("Session closed{} with {}", force ? " (forced)" : "", current_.display_name());
    reset();
    if (hooks_.active_changed)
        hooks_.active_changed(false);
}

void SessionController::reset()
{
    active_ = false;
    target_.reset();
    screen_.reset();
    current_ = make_action(Direction::NoAction);
    parent_cycle_.reset();
    frame_state_ = FrameState{};
    preview_frame_.reset();
    LOOP_ASSERT_SESSION_STATE(active_, current_, parent_cycle_, frame_state_);
}

WindowPtr SessionController::choose_target_window()
{
    if (config_.behavior.resize_window_under_cursor)
    {
        if (auto window = windows_.window_at(windows_.cursor_position()))
            return window;
    }
    return windows_.frontmost_window();
}

Screen SessionController::choose_screen() const
{
    auto screens = windows_.screens();
    if (screens.empty())
        return Screen{};

    if (config_.behavior.use_screen_with_cursor)
    {
        if (auto const* screen = screens::screen_at(screens, windows_.cursor_position()))
            return *screen;
    }
    return screens.front();
}

// ─────────────────────────────────────────────────────────────────────────────
// Changing actions
// ─────────────────────────────────────────────────────────────────────────────

void SessionController::change_action(Action const& requested, ChangeOptions options)
{
    if (!active_ || !screen_)
        return;
    if (same_manipulation(current_, requested) && !requested.manipulates_existing_frame())
        return;

    LOOP_ASSERT_ACTION_PAYLOAD(requested);

    if (stash_.handle_if_stashed(requested, *screen_))
        return;

    Action action = requested;
    if (requested.direction == Direction::Cycle)
    {
        parent_cycle_ = requested;

        if (options.can_advance_cycle)
        {
            action = next_cycle_action(requested);
        }
        else
        {
            auto const* members = requested.cycle_members();
            if (members && !contains_action(*members, current_))
                action = members->empty() ? make_action(Direction::NoAction) : members->front();
            else
                action = current_;

            if (action == current_)
                return;
        }

        // A cycle of screen switches would otherwise recurse forever
        if (options.from_screen_change && changes_screen(action.direction))
            return;
    }
    else
    {
        parent_cycle_.reset();
    }

    if (changes_screen(action.direction))
    {
        Screen next = screen_for(action.direction, *screen_);

        if (current_.direction == Direction::NoAction)
        {
            auto recorded = target_ ? history_.current_action(target_->id()) : std::nullopt;
            current_ = recorded ? *recorded : make_action(Direction::Center);
        }

        screen_ = next;
        update_preview();

        if (parent_cycle_)
        {
            current_ = action;
            Action parent = *parent_cycle_;
            change_action(parent, ChangeOptions{ .from_screen_change = true });
        }
        else if (target_ && !config_.geometry.preview_visibility)
        {
            engine_.apply(target_, current_, *screen_, frame_state_, false);
        }

        LOG_INFO("Screen changed: {}", next.name);
        return;
    }

    if (!(action == current_) || action.manipulates_existing_frame())
    {
        current_ = action;
        update_preview();
        if (target_ && !config_.geometry.preview_visibility)
            engine_.apply(target_, action, *screen_, frame_state_, false);
        LOG_INFO("Action changed: {}", action.display_name());
    }

    LOOP_ASSERT_SESSION_STATE(active_, current_, parent_cycle_, frame_state_);
}

Action SessionController::next_cycle_action(Action const& cycle) const
{
    auto const* members = cycle.cycle_members();
    if (!members || members->empty())
    {
        LOG_WARN("Cycle {} has no members", cycle.display_name());
        return make_action(Direction::NoAction);
    }

    bool reverse_allowed = cycle.eligible_for_reverse_cycle() && !config_.trigger.keys.contains(XK_Shift_L)
        && config_.behavior.cycle_backwards_on_shift;
    bool backwards = reverse_allowed && shift_pressed_;

    bool current_is_member = contains_action(*members, current_);
    if (config_.behavior.cycle_mode_restart && (current_.direction == Direction::NoAction || !current_is_member))
        return members->front();

    auto index_of = [members](Action const& action) -> std::optional<size_t> {
        auto it = std::find(members->begin(), members->end(), action);
        if (it == members->end())
            return std::nullopt;
        return static_cast<size_t>(it - members->begin());
    };

    // Continue from where the window was left by an earlier session
    std::optional<size_t> index;
    if (current_.direction == Direction::NoAction && !current_is_member && target_)
    {
        if (auto recorded = history_.current_action(target_->id()))
            index = index_of(*recorded);
    }
    else
    {
        index = index_of(current_);
    }

    return (*members)[cycle_policy::next_index(index, members->size(), backwards)];
}

Screen SessionController::screen_for(Direction direction, Screen const& current) const
{
    auto screens = windows_.screens();
    Screen const* found = nullptr;
    switch (direction)
    {
        case Direction::NextScreen:
            found = screens::next_screen(screens, current);
            break;
        case Direction::PreviousScreen:
            found = screens::previous_screen(screens, current);
            break;
        case Direction::LeftScreen:
            found = screens::directional_screen(screens, current, edge::Left);
            break;
        case Direction::RightScreen:
            found = screens::directional_screen(screens, current, edge::Right);
            break;
        case Direction::TopScreen:
            found = screens::directional_screen(screens, current, edge::Top);
            break;
        case Direction::BottomScreen:
            found = screens::directional_screen(screens, current, edge::Bottom);
            break;
        default:
            break;
    }
    return found ? *found : current;
}

void SessionController::update_preview()
{
    if (!config_.geometry.preview_visibility || !target_ || !screen_)
        return;

    preview_frame_ = engine_.preview_frame(*target_, current_, *screen_, frame_state_);
    LOG_RECT("Preview", *preview_frame_);
}

// ─────────────────────────────────────────────────────────────────────────────
// Pointer
// ─────────────────────────────────────────────────────────────────────────────

Action SessionController::radial_action(double angle, double distance) const
{
    auto const& radial = config_.radial;
    switch (radial_policy::select_slot(angle, distance, config_.behavior.radial_menu_thickness))
    {
        case radial_policy::Slot::Center:
            return radial.center;
        case radial_policy::Slot::Right:
            return radial.right;
        case radial_policy::Slot::BottomRight:
            return radial.bottom_right;
        case radial_policy::Slot::Bottom:
            return radial.bottom;
        case radial_policy::Slot::BottomLeft:
            return radial.bottom_left;
        case radial_policy::Slot::Left:
            return radial.left;
        case radial_policy::Slot::TopLeft:
            return radial.top_left;
        case radial_policy::Slot::Top:
            return radial.top;
        case radial_policy::Slot::TopRight:
            return radial.top_right;
        case radial_policy::Slot::Idle:
            break;
    }
    return make_action(Direction::NoAction);
}

void SessionController::on_pointer(PointerEvent const& event)
{
    if (!active_)
        return;

    if (event.type == PointerEventType::ButtonDown)
    {
        // Synthetic clicks come from our own focus changes
        if (event.button != LEFT_BUTTON || !event.hardware)
            return;
        if (current_.direction == Direction::NoAction || !parent_cycle_)
            return;
        Action parent = *parent_cycle_;
        change_action(parent);
        return;
    }

    if (event.type != PointerEventType::Moved)
        return;

    if (hooks_.pointer_moved)
        hooks_.pointer_moved();

    double angle = geometry::angle_degrees(initial_pointer_, event.position);
    double distance = geometry::distance(initial_pointer_, event.position);
    if (angle == pointer_angle_ && distance == pointer_distance_)
        return;

    pointer_angle_ = angle;
    pointer_distance_ = distance;
    change_action(radial_action(angle, distance), ChangeOptions{ .can_advance_cycle = false });
}

} // namespace loop
