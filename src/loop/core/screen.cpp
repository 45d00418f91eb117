#include "screen.hpp"
#include "geometry.hpp"
#include <algorithm>
#include <limits>

namespace loop::screens {

namespace {

double vertical_overlap(Rect const& a, Rect const& b)
{
    return std::min(a.max_y(), b.max_y()) - std::max(a.min_y(), b.min_y());
}

double horizontal_overlap(Rect const& a, Rect const& b)
{
    return std::min(a.max_x(), b.max_x()) - std::max(a.min_x(), b.min_x());
}

bool horizontal(EdgeSet direction) { return direction == edge::Left || direction == edge::Right; }

double perpendicular_overlap(EdgeSet direction, Rect const& current, Rect const& other)
{
    return horizontal(direction) ? vertical_overlap(current, other) : horizontal_overlap(current, other);
}

bool neighbouring(EdgeSet direction, Rect const& current, Rect const& other)
{
    switch (direction)
    {
        case edge::Left:
            return other.max_x() <= current.min_x() + OVERLAP_THRESHOLD;
        case edge::Right:
            return other.min_x() >= current.max_x() - OVERLAP_THRESHOLD;
        case edge::Top:
            return other.max_y() <= current.min_y() + OVERLAP_THRESHOLD;
        case edge::Bottom:
            return other.min_y() >= current.max_y() - OVERLAP_THRESHOLD;
        default:
            return false;
    }
}

double gap(EdgeSet direction, Rect const& current, Rect const& other)
{
    switch (direction)
    {
        case edge::Left:
            return current.min_x() - other.max_x();
        case edge::Right:
            return other.min_x() - current.max_x();
        case edge::Top:
            return current.min_y() - other.max_y();
        case edge::Bottom:
            return other.min_y() - current.max_y();
        default:
            return std::numeric_limits<double>::max();
    }
}

// Key of the far end when wrapping: larger is further in the wrap direction.
double wrap_key(EdgeSet direction, Rect const& frame)
{
    switch (direction)
    {
        case edge::Left:
            return frame.max_x();
        case edge::Right:
            return -frame.min_x();
        case edge::Top:
            return frame.max_y();
        case edge::Bottom:
            return -frame.min_y();
        default:
            return 0;
    }
}

Screen const* find(std::span<Screen const> screens, Screen const& screen)
{
    auto it = std::ranges::find(screens, screen);
    return it != screens.end() ? &*it : nullptr;
}

} // namespace

Screen const* screen_containing(std::span<Screen const> screens, Rect const& frame)
{
    if (screens.empty())
        return nullptr;
    if (screens.size() == 1)
        return &screens.front();

    Screen const* result = nullptr;
    double largest = 0;
    for (auto const& screen : screens)
    {
        if (geometry::contains(screen.frame, frame))
            return &screen;

        double area = geometry::area(geometry::intersection(screen.frame, frame));
        if (area > largest)
        {
            largest = area;
            result = &screen;
        }
    }
    return result ? result : &screens.front();
}

Screen const* screen_at(std::span<Screen const> screens, Point const& point)
{
    for (auto const& screen : screens)
    {
        if (geometry::contains(screen.frame, point))
            return &screen;
    }
    return nullptr;
}

std::vector<Screen> ordered(std::span<Screen const> screens)
{
    std::vector<Screen> result(screens.begin(), screens.end());
    std::ranges::stable_sort(
        result,
        [](Screen const& a, Screen const& b)
        {
            if (a.frame.max_y() <= b.frame.min_y())
                return true;
            if (b.frame.max_y() <= a.frame.min_y())
                return false;
            return a.frame.min_x() < b.frame.min_x();
        }
    );
    return result;
}

Screen const* next_screen(std::span<Screen const> screens, Screen const& current)
{
    auto list = ordered(screens);
    if (list.empty())
        return nullptr;

    auto it = std::ranges::find(list, current);
    if (it == list.end() || std::next(it) == list.end())
        return find(screens, list.front());
    return find(screens, *std::next(it));
}

Screen const* previous_screen(std::span<Screen const> screens, Screen const& current)
{
    auto list = ordered(screens);
    if (list.empty())
        return nullptr;

    auto it = std::ranges::find(list, current);
    if (it == list.end() || it == list.begin())
        return find(screens, list.back());
    return find(screens, *std::prev(it));
}

Screen const* directional_screen(std::span<Screen const> screens, Screen const& current, EdgeSet direction)
{
    Screen const* best = nullptr;
    double best_gap = std::numeric_limits<double>::max();
    for (auto const& other : screens)
    {
        if (other == current)
            continue;
        if (perpendicular_overlap(direction, current.frame, other.frame) < OVERLAP_THRESHOLD)
            continue;
        if (!neighbouring(direction, current.frame, other.frame))
            continue;

        double distance = gap(direction, current.frame, other.frame);
        if (distance < best_gap)
        {
            best_gap = distance;
            best = &other;
        }
    }
    if (best)
        return best;

    // Wrap to the far end, preferring screens in the same row or column
    Screen const* far_overlapping = nullptr;
    Screen const* far_any = nullptr;
    for (auto const& other : screens)
    {
        if (!far_any || wrap_key(direction, other.frame) > wrap_key(direction, far_any->frame))
            far_any = &other;

        if (other == current || perpendicular_overlap(direction, current.frame, other.frame) < OVERLAP_THRESHOLD)
            continue;
        if (!far_overlapping || wrap_key(direction, other.frame) > wrap_key(direction, far_overlapping->frame))
            far_overlapping = &other;
    }
    return far_overlapping ? far_overlapping : far_any;
}

Screen const& leftmost_in_row(std::span<Screen const> screens, Screen const& current, double threshold)
{
    Screen const* best = nullptr;
    double best_overlap = -1;
    for (auto const& screen : screens)
    {
        double overlap = std::max(0.0, vertical_overlap(current.frame, screen.frame));
        if (overlap < threshold || screen.frame.max_x() > current.frame.min_x())
            continue;

        if (overlap > best_overlap || (overlap == best_overlap && screen.frame.min_x() < best->frame.min_x()))
        {
            best = &screen;
            best_overlap = overlap;
        }
    }
    return best ? *best : current;
}

Screen const& rightmost_in_row(std::span<Screen const> screens, Screen const& current, double threshold)
{
    Screen const* best = nullptr;
    double best_overlap = -1;
    for (auto const& screen : screens)
    {
        double overlap = std::max(0.0, vertical_overlap(current.frame, screen.frame));
        if (overlap < threshold || screen.frame.min_x() < current.frame.max_x())
            continue;

        if (overlap > best_overlap || (overlap == best_overlap && screen.frame.max_x() > best->frame.max_x()))
        {
            best = &screen;
            best_overlap = overlap;
        }
    }
    return best ? *best : current;
}

} // namespace loop::screens
