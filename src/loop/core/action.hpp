#pragma once

#include "loop/core/direction.hpp"
#include "loop/core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace loop {

// ─────────────────────────────────────────────────────────────────────────────
// Custom frames
// ─────────────────────────────────────────────────────────────────────────────

enum class CustomUnit
{
    Percentage,
    Pixels,
};

enum class CustomAnchor
{
    TopLeft,
    Top,
    TopRight,
    Right,
    BottomRight,
    Bottom,
    BottomLeft,
    Left,
    Center,
    MacOSCenter,
};

enum class SizeMode
{
    Custom,
    PreserveSize,
    InitialSize,
};

enum class PositionMode
{
    Generic,     ///< Placed by anchor
    Coordinates, ///< Placed at x/y
};

/**
 * @brief User-defined frame of a Custom or Stash action
 *
 * Percentages are 0..100 of the bounds. Missing width/height count as 0.
 */
struct CustomFrame
{
    CustomUnit unit = CustomUnit::Percentage;
    CustomAnchor anchor = CustomAnchor::TopLeft;
    SizeMode size_mode = SizeMode::Custom;
    std::optional<double> width;
    std::optional<double> height;
    PositionMode position_mode = PositionMode::Generic;
    std::optional<double> x;
    std::optional<double> y;

    bool operator==(CustomFrame const&) const = default;
};

struct Action;

struct CycleMembers
{
    std::vector<Action> members;

    bool operator==(CycleMembers const& other) const;
};

enum class StashEdge
{
    Left,
    Right,
};

// ─────────────────────────────────────────────────────────────────────────────
// Action
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief A single thing that can be done to a window
 *
 * The payload is a CustomFrame only for Custom/Stash and CycleMembers only for
 * Cycle; the make_* helpers enforce that. Copies keep the id, so a member copied
 * out of a cycle still compares equal to the original.
 */
struct Action
{
    uint64_t id = 0;
    Direction direction = Direction::NoAction;
    KeySet keybind;
    std::optional<std::string> name;
    std::variant<std::monostate, CustomFrame, CycleMembers> payload;

    CustomFrame const* custom() const { return std::get_if<CustomFrame>(&payload); }
    std::vector<Action> const* cycle_members() const
    {
        auto const* cycle = std::get_if<CycleMembers>(&payload);
        return cycle ? &cycle->members : nullptr;
    }

    /// Size adjust, grow, shrink and move work on the previous target frame.
    bool manipulates_existing_frame() const;

    /// False for undo, initial frame and custom frames keeping the window's size.
    bool padding_applicable() const;

    /// A cycle whose own keybind does not use Shift.
    bool eligible_for_reverse_cycle() const;

    std::optional<StashEdge> stash_edge() const;

    std::string display_name() const;

    bool operator==(Action const&) const = default;
};

uint64_t next_action_id();

Action make_action(Direction direction, KeySet keybind = {});
Action make_custom_action(
    Direction direction,
    CustomFrame frame,
    KeySet keybind = {},
    std::optional<std::string> name = std::nullopt
);
Action make_cycle_action(
    std::vector<Action> members,
    KeySet keybind = {},
    std::optional<std::string> name = std::nullopt
);

/// Equality ignoring id, keybind and name (recursing into cycle members).
bool same_manipulation(Action const& a, Action const& b);

bool contains_action(std::vector<Action> const& actions, Action const& action);

} // namespace loop
