#include "action.hpp"
#include <X11/keysym.h>
#include <algorithm>
#include <atomic>

namespace loop {

bool CycleMembers::operator==(CycleMembers const& other) const { return members == other.members; }

uint64_t next_action_id()
{
    static std::atomic<uint64_t> counter{ 1 };
    return counter.fetch_add(1, std::memory_order_relaxed);
}

Action make_action(Direction direction, KeySet keybind)
{
    Action action;
    action.id = next_action_id();
    action.direction = direction;
    action.keybind = std::move(keybind);
    return action;
}

Action make_custom_action(Direction direction, CustomFrame frame, KeySet keybind, std::optional<std::string> name)
{
    Action action = make_action(is_customizable(direction) ? direction : Direction::Custom, std::move(keybind));
    action.name = std::move(name);
    action.payload = frame;
    return action;
}

Action make_cycle_action(std::vector<Action> members, KeySet keybind, std::optional<std::string> name)
{
    Action action = make_action(Direction::Cycle, std::move(keybind));
    action.name = std::move(name);
    action.payload = CycleMembers{ std::move(members) };
    return action;
}

bool Action::manipulates_existing_frame() const
{
    return adjusts_size(direction) || shrinks(direction) || grows(direction) || moves(direction);
}

bool Action::padding_applicable() const
{
    if (direction == Direction::Undo || direction == Direction::InitialFrame)
        return false;

    if (is_customizable(direction))
    {
        if (auto const* frame = custom())
        {
            if (frame->size_mode == SizeMode::InitialSize || frame->size_mode == SizeMode::PreserveSize)
                return false;
        }
    }
    return true;
}

bool Action::eligible_for_reverse_cycle() const
{
    return direction == Direction::Cycle && !keybind.contains(XK_Shift_L);
}

std::optional<StashEdge> Action::stash_edge() const
{
    if (direction != Direction::Stash)
        return std::nullopt;

    auto const* frame = custom();
    if (!frame)
        return std::nullopt;

    switch (frame->anchor)
    {
        case CustomAnchor::Left:
        case CustomAnchor::TopLeft:
        case CustomAnchor::BottomLeft:
            return StashEdge::Left;
        case CustomAnchor::Right:
        case CustomAnchor::TopRight:
        case CustomAnchor::BottomRight:
            return StashEdge::Right;
        default:
            return std::nullopt;
    }
}

std::string Action::display_name() const
{
    switch (direction)
    {
        case Direction::Custom:
            return name.value_or("Custom Keybind");
        case Direction::Stash:
            return "Stash";
        case Direction::Cycle:
            return name.value_or("Custom Cycle");
        default:
            return std::string(to_string(direction));
    }
}

bool same_manipulation(Action const& a, Action const& b)
{
    if (a.direction != b.direction)
        return false;
    if (a.custom() || b.custom())
        return a.custom() && b.custom() && *a.custom() == *b.custom();

    auto const* lhs = a.cycle_members();
    auto const* rhs = b.cycle_members();
    if (!lhs || !rhs)
        return lhs == rhs;

    return std::ranges::equal(*lhs, *rhs, [](Action const& x, Action const& y) { return same_manipulation(x, y); });
}

bool contains_action(std::vector<Action> const& actions, Action const& action)
{
    return std::ranges::find(actions, action) != actions.end();
}

} // namespace loop
