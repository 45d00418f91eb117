#include "resolver.hpp"
#include "geometry.hpp"
#include "log.hpp"
#include <cmath>

namespace loop::resolver {

namespace {

Rect zero_at_center(Rect const& bounds) { return { bounds.mid_x(), bounds.mid_y(), 0, 0 }; }

Rect scale_into(Rect const& fractions, Rect const& bounds)
{
    return {
        bounds.x + bounds.width * fractions.x,
        bounds.y + bounds.height * fractions.y,
        bounds.width * fractions.width,
        bounds.height * fractions.height,
    };
}

// Same as NSWindow.center(): shifted up by an amount depending on the window height.
double macos_center_offset(double window_height, double screen_height)
{
    double half_screen = screen_height / 2;
    double percent = window_height / screen_height;
    return (0.5 * percent - 0.5) * half_screen;
}

Rect custom_frame(Request const& request, CustomFrame const& custom, Rect const& bounds)
{
    auto const& window = request.window;
    auto const& reference = request.reference_screen_frame;
    Rect result{ bounds.x, bounds.y, 0, 0 };

    if (custom.size_mode == SizeMode::PreserveSize && window)
    {
        result.width = window->frame.width;
        result.height = window->frame.height;
    }
    else if (custom.size_mode == SizeMode::InitialSize && window)
    {
        if (window->initial_frame)
        {
            result.width = window->initial_frame->width;
            result.height = window->initial_frame->height;
        }
    }
    else if (custom.unit == CustomUnit::Pixels)
    {
        if (!window && reference.width > 0 && reference.height > 0)
        {
            result.width = (custom.width.value_or(0) / reference.width) * bounds.width;
            result.height = (custom.height.value_or(0) / reference.height) * bounds.height;
        }
        else
        {
            result.width = custom.width.value_or(0);
            result.height = custom.height.value_or(0);
        }
    }
    else
    {
        if (custom.width)
            result.width = bounds.width * (*custom.width / 100.0);
        if (custom.height)
            result.height = bounds.height * (*custom.height / 100.0);
    }

    if (custom.position_mode == PositionMode::Coordinates)
    {
        if (custom.unit == CustomUnit::Pixels)
        {
            if (!window && reference.width > 0 && reference.height > 0)
            {
                result.x += (custom.x.value_or(0) / reference.width) * bounds.width;
                result.y += (custom.y.value_or(0) / reference.height) * bounds.height;
            }
            else
            {
                result.x += custom.x.value_or(0);
                result.y += custom.y.value_or(0);
            }
        }
        else
        {
            if (custom.x)
                result.x += bounds.width * (*custom.x / 100.0);
            if (custom.y)
                result.y += bounds.height * (*custom.y / 100.0);
        }
        return result;
    }

    switch (custom.anchor)
    {
        case CustomAnchor::Top:
            result.x = bounds.mid_x() - result.width / 2;
            break;
        case CustomAnchor::TopRight:
            result.x = bounds.max_x() - result.width;
            break;
        case CustomAnchor::Right:
            result.x = bounds.max_x() - result.width;
            result.y = bounds.mid_y() - result.height / 2;
            break;
        case CustomAnchor::BottomRight:
            result.x = bounds.max_x() - result.width;
            result.y = bounds.max_y() - result.height;
            break;
        case CustomAnchor::Bottom:
            result.x = bounds.mid_x() - result.width / 2;
            result.y = bounds.max_y() - result.height;
            break;
        case CustomAnchor::BottomLeft:
            result.y = bounds.max_y() - result.height;
            break;
        case CustomAnchor::Left:
            result.y = bounds.mid_y() - result.height / 2;
            break;
        case CustomAnchor::Center:
            result.x = bounds.mid_x() - result.width / 2;
            result.y = bounds.mid_y() - result.height / 2;
            break;
        case CustomAnchor::MacOSCenter:
            result.x = bounds.mid_x() - result.width / 2;
            result.y = bounds.mid_y() - result.height / 2 + macos_center_offset(result.height, bounds.height);
            break;
        case CustomAnchor::TopLeft:
            break;
    }
    return result;
}

Rect center_frame(std::optional<WindowSnapshot> const& window, Rect const& bounds, bool macos)
{
    Size size = window ? window->frame.size() : Size{ bounds.width / 2, bounds.height / 2 };
    double offset = macos ? macos_center_offset(size.height, bounds.height) : 0;
    return { bounds.mid_x() - size.width / 2, bounds.mid_y() - size.height / 2 + offset, size.width, size.height };
}

Rect size_adjustment(Direction direction, Rect const& from, Rect const& bounds, GeometryConfig const& config, FrameState& state)
{
    Rect result = from;
    double step = config.size_increment * ((direction == Direction::Larger || grows(direction)) ? -1 : 1);

    auto const& padding = config.padding;
    double min_width = padding.left + padding.right + config.preview_padding + 100;
    double min_height = padding.total_top() + padding.bottom + config.preview_padding + 100;

    if (!state.sides_to_adjust)
        state.sides_to_adjust = static_cast<EdgeSet>(edge::All & ~geometry::edges_touching(from, bounds));

    EdgeSet edges = *state.sides_to_adjust;
    if (edges == edge::Empty || (edges & edge::All) == edge::All)
    {
        result = geometry::inset_all(result, step, { min_width, min_height });
    }
    else
    {
        result = geometry::inset_edges(result, edges, step);

        if (result.width < min_width)
        {
            result.width = min_width;
            result.x = from.mid_x() - min_width / 2;
        }
        if (result.height < min_height)
        {
            result.height = min_height;
            result.y = from.mid_y() - min_height / 2;
        }
    }

    if (geometry::approx_equal(result.size(), state.last_target_frame.size(), 2))
        result = state.last_target_frame;

    return result;
}

Rect position_adjustment(Direction direction, Rect const& from, double increment)
{
    Rect result = from;
    switch (direction)
    {
        case Direction::MoveUp:
            result.y -= increment;
            break;
        case Direction::MoveDown:
            result.y += increment;
            break;
        case Direction::MoveRight:
            result.x += increment;
            break;
        case Direction::MoveLeft:
            result.x -= increment;
            break;
        default:
            break;
    }
    return result;
}

EdgeSet sides_for(Direction direction)
{
    switch (direction)
    {
        case Direction::ShrinkTop:
        case Direction::GrowTop:
            return edge::Top;
        case Direction::ShrinkBottom:
        case Direction::GrowBottom:
            return edge::Bottom;
        case Direction::ShrinkLeft:
        case Direction::GrowLeft:
            return edge::Left;
        case Direction::ShrinkHorizontal:
        case Direction::GrowHorizontal:
            return edge::Left | edge::Right;
        case Direction::ShrinkVertical:
        case Direction::GrowVertical:
            return edge::Top | edge::Bottom;
        default:
            return edge::Right;
    }
}

Rect initial_frame_of(WindowSnapshot const& window)
{
    if (window.initial_frame)
        return *window.initial_frame;
    LOG_INFO("No initial frame recorded, using current frame");
    return window.frame;
}

Rect target_frame(Request const& request, Rect const& bounds, GeometryConfig const& config, FrameState& state)
{
    auto const& action = request.action;
    auto const& window = request.window;
    Direction direction = action.direction;

    if (auto fractions = frame_fractions(direction))
        return scale_into(request.proportional_frame.value_or(*fractions), bounds);

    if (action.manipulates_existing_frame())
    {
        // A fixed-size window cannot be grown or shrunk
        if (window && !window->resizable && !moves(direction))
            return window->frame;

        // Once the preview settled the frame, applying it reuses that frame
        if (config.preview_visibility && !request.is_preview)
            return state.last_target_frame;

        if (moves(direction))
            return position_adjustment(direction, state.last_target_frame, config.size_increment);

        if (shrinks(direction) || grows(direction))
            state.sides_to_adjust = sides_for(direction);

        return size_adjustment(direction, state.last_target_frame, bounds, config, state);
    }

    if (is_customizable(direction))
    {
        if (auto const* custom = action.custom())
            return custom_frame(request, *custom, bounds);
        return custom_frame(request, CustomFrame{}, bounds);
    }

    switch (direction)
    {
        case Direction::Center:
            return center_frame(window, bounds, false);
        case Direction::MacOSCenter:
            return center_frame(window, bounds, true);
        case Direction::Undo:
            if (window)
            {
                if (window->last_action)
                {
                    LOG_INFO("Undoing to {}", window->last_action->display_name());
                    Request previous = request;
                    previous.action = *window->last_action;
                    previous.window->last_action.reset();
                    previous.is_preview = false;
                    previous.proportional_frame.reset();
                    return resolve(previous, config, state);
                }
                LOG_INFO("Nothing to undo, using current frame");
                return window->frame;
            }
            break;
        case Direction::InitialFrame:
        case Direction::Unstash:
            if (window)
                return initial_frame_of(*window);
            break;
        case Direction::MaximizeHeight:
            if (window)
                return { window->frame.x, bounds.y, window->frame.width, bounds.height };
            break;
        case Direction::MaximizeWidth:
            if (window)
                return { bounds.x, window->frame.y, bounds.width, window->frame.height };
            break;
        default:
            break;
    }
    return {};
}

Rect inner_padding(Request const& request, Rect const& frame, Rect const& bounds, GeometryConfig const& config)
{
    auto const& action = request.action;
    auto const& padding = config.padding;
    if (!padding.enabled || moves(action.direction))
        return frame;

    Rect cropped = geometry::intersection(frame, bounds);

    if (padding.minimum_screen_size != 0 && request.screen_diagonal.value_or(0) < padding.minimum_screen_size)
        return frame;

    if (action.manipulates_existing_frame())
        return cropped;

    double half = padding.window / 2;

    if (action.direction == Direction::MacOSCenter && frame.height >= bounds.height)
    {
        cropped.y = bounds.y;
        cropped.height = bounds.height;
    }

    if (action.direction == Direction::Center || action.direction == Direction::MacOSCenter)
        return cropped;

    if (std::abs(cropped.min_x() - bounds.min_x()) > 1)
        cropped = geometry::inset_edges(cropped, edge::Left, half);
    if (std::abs(cropped.max_x() - bounds.max_x()) > 1)
        cropped = geometry::inset_edges(cropped, edge::Right, half);
    if (std::abs(cropped.min_y() - bounds.min_y()) > 1)
        cropped = geometry::inset_edges(cropped, edge::Top, half);
    if (std::abs(cropped.max_y() - bounds.max_y()) > 1)
        cropped = geometry::inset_edges(cropped, edge::Bottom, half);

    return cropped;
}

} // namespace

bool padding_applies(GeometryConfig const& config, std::optional<double> screen_diagonal)
{
    auto const& padding = config.padding;
    return padding.enabled
        && (padding.minimum_screen_size == 0 || screen_diagonal.value_or(0) > padding.minimum_screen_size);
}

Rect padded_bounds(Rect const& bounds, PaddingConfig const& padding)
{
    Rect result = geometry::inset_edges(bounds, edge::Top, padding.total_top());
    result = geometry::inset_edges(result, edge::Bottom, padding.bottom);
    result = geometry::inset_edges(result, edge::Left, padding.left);
    return geometry::inset_edges(result, edge::Right, padding.right);
}

std::optional<Rect> proportional_frame(Rect const& frame, Rect const& source_bounds)
{
    if (source_bounds.width <= 0 || source_bounds.height <= 0)
        return std::nullopt;
    if (!geometry::intersects(frame, source_bounds))
        return std::nullopt;

    Rect fractions{
        (frame.x - source_bounds.x) / source_bounds.width,
        (frame.y - source_bounds.y) / source_bounds.height,
        frame.width / source_bounds.width,
        frame.height / source_bounds.height,
    };

    bool valid = fractions.x > -0.1 && fractions.y > -0.1 && fractions.width > 0 && fractions.width <= 1.1
        && fractions.height > 0 && fractions.height <= 1.1;
    if (!valid)
        return std::nullopt;
    return fractions;
}

Rect resolve(Request const& request, GeometryConfig const& config, FrameState& state)
{
    auto const& action = request.action;
    if (has_no_frame(action.direction))
        return zero_at_center(request.bounds);

    bool relative = action.manipulates_existing_frame();
    if (!relative)
        state.sides_to_adjust.reset();

    Rect bounds = request.bounds;
    if (!request.disable_padding && padding_applies(config, request.screen_diagonal))
        bounds = padded_bounds(bounds, config.padding);

    Rect result = target_frame(request, bounds, config, state);

    if (!request.disable_padding)
    {
        if (!relative)
        {
            bounds = geometry::integral(bounds);
            result = geometry::integral(result);
        }

        if (request.window && !request.window->resizable)
            result = geometry::push_inside(geometry::centered_in(request.window->frame.size(), result), bounds);
        else if (action.padding_applicable())
            result = inner_padding(request, result, bounds, config);

        state.last_target_frame = result;
    }

    if (result.width < 0 || result.height < 0)
        result = zero_at_center(bounds);

    return result;
}

} // namespace loop::resolver
