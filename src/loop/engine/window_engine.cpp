#include "window_engine.hpp"
#include "loop/core/geometry.hpp"
#include "loop/core/log.hpp"
#include "loop/core/policy.hpp"
#include "loop/core/screen.hpp"
#include "loop/stash/stash_manager.hpp"

namespace loop {

WindowEngine::WindowEngine(
    Config const& config,
    WindowSystem& windows,
    WindowHistory& history,
    FrameAnimator& animator,
    StashManager& stash
)
    : config_(config)
    , windows_(windows)
    , history_(history)
    , animator_(animator)
    , stash_(stash)
{
}

void WindowEngine::apply(
    WindowPtr const& window,
    Action const& action,
    Screen const& screen,
    FrameState& frame_state,
    bool should_record
)
{
    if (action.direction == Direction::NoAction)
        return;

    auto screens = windows_.screens();
    Screen const* current_screen = screens::screen_containing(screens, window->frame());
    bool changes_screens = !current_screen || !(*current_screen == screen);

    LOG_INFO("Resizing {:#x} ({}) to {} on {}", window->id(), window->app_class(), action.display_name(), screen.name);

    // Recorded before anything changes so undo can return here
    if (should_record)
        history_.record(window->id(), window->frame(), action);

    std::optional<Rect> proportional;
    if (changes_screens && current_screen)
        proportional = proportional_source(*window, *current_screen, action);

    switch (action.direction)
    {
        case Direction::Hide:
            window->set_application_hidden(!window->application_hidden());
            return;
        case Direction::Minimize:
            window->set_minimized(!window->minimized());
            return;
        case Direction::Fullscreen:
            window->set_fullscreen(!window->fullscreen());
            return;
        case Direction::MinimizeOthers:
            minimize_others(*window);
            return;
        default:
            break;
    }

    if (config_.behavior.focus_window_on_resize)
        window->activate();

    if (!changes_screens && config_.behavior.use_system_window_manager && window->perform_native(action.direction))
    {
        LOG_DEBUG("{} handled by the window manager", action.display_name());
        if (!config_.geometry.preview_visibility)
            frame_state.last_target_frame = window->frame();
        return;
    }

    window->set_fullscreen(false);

    resolver::Request request{
        .action = action,
        .window = history_.snapshot(*window),
        .bounds = screen.visible_frame,
        .screen_diagonal = screen.diagonal_inches,
        .proportional_frame = proportional,
        .reference_screen_frame = reference_frame(),
    };
    Rect target = resolver::resolve(request, config_.geometry, frame_state);
    LOG_RECT("Target frame", target);

    if (action.direction == Direction::Undo)
        history_.remove_last_action(window->id());

    bool animate = animation_policy::should_animate(
        window->enhanced_user_interface().value_or(false),
        config_.behavior.animate_window_resizes,
        windows_.low_power_mode(),
        config_.behavior.ignore_low_power_mode
    );
    resize(window, target, screen, moves(action.direction), animate);

    if (config_.behavior.move_cursor_with_window)
        windows_.warp_cursor(target.center());

    stash_.on_window_resized(action, window, screen);
}

Rect WindowEngine::preview_frame(Window const& window, Action const& action, Screen const& screen, FrameState& frame_state) const
{
    resolver::Request request{
        .action = action,
        .window = history_.snapshot(window),
        .bounds = screen.visible_frame,
        .screen_diagonal = screen.diagonal_inches,
        .is_preview = true,
        .reference_screen_frame = reference_frame(),
    };
    return resolver::resolve(request, config_.geometry, frame_state);
}

void WindowEngine::minimize_others(Window const& except)
{
    size_t count = 0;
    for (auto const& other : windows_.window_list())
    {
        if (other->id() == except.id() || other->minimized() || other->hidden())
            continue;
        other->set_minimized(true);
        ++count;
    }
    LOG_INFO("Minimized {} other window(s)", count);
}

void WindowEngine::resize(WindowPtr const& window, Rect const& target, Screen const& screen, bool ignore_padding, bool animate)
{
    // Moves may leave the screen, so they get no bounds
    Rect bounds;
    if (!ignore_padding)
    {
        bounds = resolver::padding_applies(config_.geometry, screen.diagonal_inches)
            ? resolver::padded_bounds(screen.visible_frame, config_.geometry.padding)
            : screen.visible_frame;
    }

    auto enhanced = window->enhanced_user_interface();
    if (enhanced.value_or(false))
    {
        LOG_INFO("Disabling enhanced UI of {:#x} while resizing", window->id());
        window->set_enhanced_user_interface(false);
    }

    if (animate)
    {
        std::weak_ptr<Window> weak = window;
        animator_.animate(window, target, bounds, [this, weak, bounds] {
            if (auto w = weak.lock())
                push_inside_bounds(*w, bounds);
        });
    }
    else
    {
        animator_.set_frame(window, target);
        // Some clients apply the position before the size across monitors
        if (!geometry::approx_equal(window->frame(), target, FRAME_TOLERANCE))
            window->set_frame(target);
        push_inside_bounds(*window, bounds);
    }

    if (enhanced.value_or(false))
        window->set_enhanced_user_interface(true);
}

void WindowEngine::push_inside_bounds(Window& window, Rect const& bounds)
{
    if (bounds == Rect{})
        return;

    Rect frame = window.frame();
    if (frame.max_x() <= bounds.max_x() && frame.max_y() <= bounds.max_y())
        return;

    if (frame.max_x() > bounds.max_x())
        frame.x = bounds.max_x() - frame.width;
    if (frame.max_y() > bounds.max_y())
        frame.y = bounds.max_y() - frame.height;

    LOG_DEBUG("{:#x} exceeds its bounds, pushing it back", window.id());
    window.set_position(frame.origin());
}

std::optional<Rect> WindowEngine::proportional_source(Window const& window, Screen const& from, Action const& action) const
{
    if (!frame_fractions(action.direction))
        return std::nullopt;

    Rect bounds = resolver::padding_applies(config_.geometry, from.diagonal_inches)
        ? resolver::padded_bounds(from.visible_frame, config_.geometry.padding)
        : from.visible_frame;

    auto proportions = resolver::proportional_frame(window.frame(), bounds);
    if (!proportions)
        LOG_DEBUG("No proportional frame for {:#x}", window.id());
    return proportions;
}

Rect WindowEngine::reference_frame() const
{
    auto screens = windows_.screens();
    return screens.empty() ? Rect{} : screens.front().frame;
}

} // namespace loop
