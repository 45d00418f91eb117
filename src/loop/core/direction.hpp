#pragma once

#include "loop/core/types.hpp"
#include <optional>
#include <string_view>

namespace loop {

enum class Direction
{
    NoAction,
    Maximize,
    AlmostMaximize,
    Fullscreen,
    MaximizeHeight,
    MaximizeWidth,
    Undo,
    InitialFrame,
    Hide,
    Minimize,
    MinimizeOthers,
    MacOSCenter,
    Center,

    // Halves
    TopHalf,
    RightHalf,
    BottomHalf,
    LeftHalf,
    HorizontalCenterHalf,
    VerticalCenterHalf,

    // Quarters
    TopLeftQuarter,
    TopRightQuarter,
    BottomRightQuarter,
    BottomLeftQuarter,

    // Horizontal thirds
    RightThird,
    RightTwoThirds,
    HorizontalCenterThird,
    LeftThird,
    LeftTwoThirds,

    // Horizontal fourths
    FirstFourth,
    SecondFourth,
    ThirdFourth,
    FourthFourth,
    LeftThreeFourths,
    RightThreeFourths,

    // Vertical thirds
    TopThird,
    TopTwoThirds,
    VerticalCenterThird,
    BottomThird,
    BottomTwoThirds,

    // Screen switching
    NextScreen,
    PreviousScreen,
    LeftScreen,
    RightScreen,
    TopScreen,
    BottomScreen,

    // Size adjustment
    Larger,
    Smaller,

    ShrinkTop,
    ShrinkBottom,
    ShrinkRight,
    ShrinkLeft,
    ShrinkHorizontal,
    ShrinkVertical,

    GrowTop,
    GrowBottom,
    GrowRight,
    GrowLeft,
    GrowHorizontal,
    GrowVertical,

    MoveUp,
    MoveDown,
    MoveRight,
    MoveLeft,

    Stash,
    Unstash,

    Custom,
    Cycle,
};

/// Stable name used in config and state files ("TopHalf", "MacOSCenter", ...).
std::string_view to_string(Direction direction);
std::optional<Direction> direction_from_string(std::string_view name);

bool changes_screen(Direction direction);
bool adjusts_size(Direction direction); ///< Larger / Smaller
bool shrinks(Direction direction);
bool grows(Direction direction);
bool moves(Direction direction);
bool maximizes(Direction direction);
bool centers(Direction direction);
bool is_customizable(Direction direction); ///< Custom / Stash

/// Directions with no frame of their own (zero-size result at the bounds centre).
bool has_no_frame(Direction direction);

/// Fixed layout as fractions of the bounds, nullopt for directions without one.
std::optional<Rect> frame_fractions(Direction direction);

} // namespace loop
