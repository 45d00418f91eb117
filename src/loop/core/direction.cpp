#include "direction.hpp"
#include <algorithm>
#include <array>
#include <utility>

namespace loop {

namespace {

constexpr std::array<std::pair<Direction, std::string_view>, 67> DIRECTION_NAMES = { {
    { Direction::NoAction, "NoAction" },
    { Direction::Maximize, "Maximize" },
    { Direction::AlmostMaximize, "AlmostMaximize" },
    { Direction::Fullscreen, "Fullscreen" },
    { Direction::MaximizeHeight, "MaximizeHeight" },
    { Direction::MaximizeWidth, "MaximizeWidth" },
    { Direction::Undo, "Undo" },
    { Direction::InitialFrame, "InitialFrame" },
    { Direction::Hide, "Hide" },
    { Direction::Minimize, "Minimize" },
    { Direction::MinimizeOthers, "MinimizeOthers" },
    { Direction::MacOSCenter, "MacOSCenter" },
    { Direction::Center, "Center" },
    { Direction::TopHalf, "TopHalf" },
    { Direction::RightHalf, "RightHalf" },
    { Direction::BottomHalf, "BottomHalf" },
    { Direction::LeftHalf, "LeftHalf" },
    { Direction::HorizontalCenterHalf, "HorizontalCenterHalf" },
    { Direction::VerticalCenterHalf, "VerticalCenterHalf" },
    { Direction::TopLeftQuarter, "TopLeftQuarter" },
    { Direction::TopRightQuarter, "TopRightQuarter" },
    { Direction::BottomRightQuarter, "BottomRightQuarter" },
    { Direction::BottomLeftQuarter, "BottomLeftQuarter" },
    { Direction::RightThird, "RightThird" },
    { Direction::RightTwoThirds, "RightTwoThirds" },
    { Direction::HorizontalCenterThird, "HorizontalCenterThird" },
    { Direction::LeftThird, "LeftThird" },
    { Direction::LeftTwoThirds, "LeftTwoThirds" },
    { Direction::FirstFourth, "FirstFourth" },
    { Direction::SecondFourth, "SecondFourth" },
    { Direction::ThirdFourth, "ThirdFourth" },
    { Direction::FourthFourth, "FourthFourth" },
    { Direction::LeftThreeFourths, "LeftThreeFourths" },
    { Direction::RightThreeFourths, "RightThreeFourths" },
    { Direction::TopThird, "TopThird" },
    { Direction::TopTwoThirds, "TopTwoThirds" },
    { Direction::VerticalCenterThird, "VerticalCenterThird" },
    { Direction::BottomThird, "BottomThird" },
    { Direction::BottomTwoThirds, "BottomTwoThirds" },
    { Direction::NextScreen, "NextScreen" },
    { Direction::PreviousScreen, "PreviousScreen" },
    { Direction::LeftScreen, "LeftScreen" },
    { Direction::RightScreen, "RightScreen" },
    { Direction::TopScreen, "TopScreen" },
    { Direction::BottomScreen, "BottomScreen" },
    { Direction::Larger, "Larger" },
    { Direction::Smaller, "Smaller" },
    { Direction::ShrinkTop, "ShrinkTop" },
    { Direction::ShrinkBottom, "ShrinkBottom" },
    { Direction::ShrinkRight, "ShrinkRight" },
    { Direction::ShrinkLeft, "ShrinkLeft" },
    { Direction::ShrinkHorizontal, "ShrinkHorizontal" },
    { Direction::ShrinkVertical, "ShrinkVertical" },
    { Direction::GrowTop, "GrowTop" },
    { Direction::GrowBottom, "GrowBottom" },
    { Direction::GrowRight, "GrowRight" },
    { Direction::GrowLeft, "GrowLeft" },
    { Direction::GrowHorizontal, "GrowHorizontal" },
    { Direction::GrowVertical, "GrowVertical" },
    { Direction::MoveUp, "MoveUp" },
    { Direction::MoveDown, "MoveDown" },
    { Direction::MoveRight, "MoveRight" },
    { Direction::MoveLeft, "MoveLeft" },
    { Direction::Stash, "Stash" },
    { Direction::Unstash, "Unstash" },
    { Direction::Custom, "Custom" },
    { Direction::Cycle, "Cycle" },
} };

} // namespace

std::string_view to_string(Direction direction)
{
    auto it = std::ranges::find(DIRECTION_NAMES, direction, &std::pair<Direction, std::string_view>::first);
    return it != DIRECTION_NAMES.end() ? it->second : "NoAction";
}

std::optional<Direction> direction_from_string(std::string_view name)
{
    auto it = std::ranges::find(DIRECTION_NAMES, name, &std::pair<Direction, std::string_view>::second);
    if (it == DIRECTION_NAMES.end())
        return std::nullopt;
    return it->first;
}

bool changes_screen(Direction direction)
{
    switch (direction)
    {
        case Direction::NextScreen:
        case Direction::PreviousScreen:
        case Direction::LeftScreen:
        case Direction::RightScreen:
        case Direction::TopScreen:
        case Direction::BottomScreen:
            return true;
        default:
            return false;
    }
}

bool adjusts_size(Direction direction) { return direction == Direction::Larger || direction == Direction::Smaller; }

bool shrinks(Direction direction)
{
    switch (direction)
    {
        case Direction::ShrinkTop:
        case Direction::ShrinkBottom:
        case Direction::ShrinkRight:
        case Direction::ShrinkLeft:
        case Direction::ShrinkHorizontal:
        case Direction::ShrinkVertical:
            return true;
        default:
            return false;
    }
}

bool grows(Direction direction)
{
    switch (direction)
    {
        case Direction::GrowTop:
        case Direction::GrowBottom:
        case Direction::GrowRight:
        case Direction::GrowLeft:
        case Direction::GrowHorizontal:
        case Direction::GrowVertical:
            return true;
        default:
            return false;
    }
}

bool moves(Direction direction)
{
    switch (direction)
    {
        case Direction::MoveUp:
        case Direction::MoveDown:
        case Direction::MoveRight:
        case Direction::MoveLeft:
            return true;
        default:
            return false;
    }
}

bool maximizes(Direction direction)
{
    switch (direction)
    {
        case Direction::Fullscreen:
        case Direction::Maximize:
        case Direction::AlmostMaximize:
        case Direction::MaximizeHeight:
        case Direction::MaximizeWidth:
            return true;
        default:
            return false;
    }
}

bool centers(Direction direction)
{
    switch (direction)
    {
        case Direction::Center:
        case Direction::MacOSCenter:
        case Direction::VerticalCenterHalf:
        case Direction::HorizontalCenterHalf:
            return true;
        default:
            return false;
    }
}

bool is_customizable(Direction direction) { return direction == Direction::Custom || direction == Direction::Stash; }

bool has_no_frame(Direction direction)
{
    switch (direction)
    {
        case Direction::NoAction:
        case Direction::Cycle:
        case Direction::Minimize:
        case Direction::Hide:
            return true;
        default:
            return false;
    }
}

std::optional<Rect> frame_fractions(Direction direction)
{
    switch (direction)
    {
        case Direction::Maximize:
        case Direction::Fullscreen:
            return Rect{ 0, 0, 1.0, 1.0 };
        case Direction::AlmostMaximize:
            return Rect{ 0.5 / 10.0, 0.5 / 10.0, 9.0 / 10.0, 9.0 / 10.0 };

        case Direction::TopHalf:
            return Rect{ 0, 0, 1.0, 1.0 / 2.0 };
        case Direction::RightHalf:
            return Rect{ 1.0 / 2.0, 0, 1.0 / 2.0, 1.0 };
        case Direction::BottomHalf:
            return Rect{ 0, 1.0 / 2.0, 1.0, 1.0 / 2.0 };
        case Direction::LeftHalf:
            return Rect{ 0, 0, 1.0 / 2.0, 1.0 };
        case Direction::HorizontalCenterHalf:
            return Rect{ 1.0 / 4.0, 0, 1.0 / 2.0, 1.0 };
        case Direction::VerticalCenterHalf:
            return Rect{ 0, 1.0 / 4.0, 1.0, 1.0 / 2.0 };

        case Direction::TopLeftQuarter:
            return Rect{ 0, 0, 1.0 / 2.0, 1.0 / 2.0 };
        case Direction::TopRightQuarter:
            return Rect{ 1.0 / 2.0, 0, 1.0 / 2.0, 1.0 / 2.0 };
        case Direction::BottomRightQuarter:
            return Rect{ 1.0 / 2.0, 1.0 / 2.0, 1.0 / 2.0, 1.0 / 2.0 };
        case Direction::BottomLeftQuarter:
            return Rect{ 0, 1.0 / 2.0, 1.0 / 2.0, 1.0 / 2.0 };

        case Direction::RightThird:
            return Rect{ 2.0 / 3.0, 0, 1.0 / 3.0, 1.0 };
        case Direction::RightTwoThirds:
            return Rect{ 1.0 / 3.0, 0, 2.0 / 3.0, 1.0 };
        case Direction::HorizontalCenterThird:
            return Rect{ 1.0 / 3.0, 0, 1.0 / 3.0, 1.0 };
        case Direction::LeftThird:
            return Rect{ 0, 0, 1.0 / 3.0, 1.0 };
        case Direction::LeftTwoThirds:
            return Rect{ 0, 0, 2.0 / 3.0, 1.0 };

        case Direction::TopThird:
            return Rect{ 0, 0, 1.0, 1.0 / 3.0 };
        case Direction::TopTwoThirds:
            return Rect{ 0, 0, 1.0, 2.0 / 3.0 };
        case Direction::VerticalCenterThird:
            return Rect{ 0, 1.0 / 3.0, 1.0, 1.0 / 3.0 };
        case Direction::BottomThird:
            return Rect{ 0, 2.0 / 3.0, 1.0, 1.0 / 3.0 };
        case Direction::BottomTwoThirds:
            return Rect{ 0, 1.0 / 3.0, 1.0, 2.0 / 3.0 };

        case Direction::FirstFourth:
            return Rect{ 0, 0, 1.0 / 4.0, 1.0 };
        case Direction::SecondFourth:
            return Rect{ 1.0 / 4.0, 0, 1.0 / 4.0, 1.0 };
        case Direction::ThirdFourth:
            return Rect{ 2.0 / 4.0, 0, 1.0 / 4.0, 1.0 };
        case Direction::FourthFourth:
            return Rect{ 3.0 / 4.0, 0, 1.0 / 4.0, 1.0 };
        case Direction::LeftThreeFourths:
            return Rect{ 0, 0, 3.0 / 4.0, 1.0 };
        case Direction::RightThreeFourths:
            return Rect{ 1.0 / 4.0, 0, 3.0 / 4.0, 1.0 };

        default:
            return std::nullopt;
    }
}

} // namespace loop
