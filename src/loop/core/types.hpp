#pragma once

#include <cstdint>
#include <set>
#include <string>

namespace loop {

// ─────────────────────────────────────────────────────────────────────────────
// Basic geometry types
//
// Global root-window coordinates, y grows downwards. Kept as double so relative
// chains (grow, shrink, move) do not accumulate rounding; the resolver decides
// when a rect becomes integral.
// ─────────────────────────────────────────────────────────────────────────────

struct Point
{
    double x = 0;
    double y = 0;

    bool operator==(Point const&) const = default;
};

struct Size
{
    double width = 0;
    double height = 0;

    bool operator==(Size const&) const = default;
};

struct Rect
{
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    double min_x() const { return x; }
    double mid_x() const { return x + width / 2; }
    double max_x() const { return x + width; }
    double min_y() const { return y; }
    double mid_y() const { return y + height / 2; }
    double max_y() const { return y + height; }

    Point origin() const { return { x, y }; }
    Size size() const { return { width, height }; }
    Point center() const { return { mid_x(), mid_y() }; }

    bool operator==(Rect const&) const = default;
};

/// Bit set over the four edges of a rect. Left is the leading edge.
using EdgeSet = uint8_t;

namespace edge {

constexpr EdgeSet Empty = 0;
constexpr EdgeSet Top = 1 << 0;
constexpr EdgeSet Bottom = 1 << 1;
constexpr EdgeSet Left = 1 << 2;
constexpr EdgeSet Right = 1 << 3;
constexpr EdgeSet All = Top | Bottom | Left | Right;

} // namespace edge

// ─────────────────────────────────────────────────────────────────────────────
// Screens and windows
// ─────────────────────────────────────────────────────────────────────────────

using WindowId = uint32_t;

struct Screen
{
    uint32_t id = 0; ///< RandR output, 0 for the fallback screen
    std::string name;
    Rect frame;                 ///< Full display bounds
    Rect visible_frame;         ///< Display bounds minus panels (_NET_WORKAREA)
    double diagonal_inches = 0; ///< 0 when the physical size is unknown

    /// Two screens are the same display when their outputs match.
    bool operator==(Screen const& other) const { return id == other.id; }
};

// ─────────────────────────────────────────────────────────────────────────────
// Keys
//
// A key is an X keysym normalised so that left/right modifier variants compare
// equal (see normalize_key in keybind.hpp).
// ─────────────────────────────────────────────────────────────────────────────

using Key = uint32_t;
using KeySet = std::set<Key>;

} // namespace loop
