#include "action_toml.hpp"
#include "loop/keybind/keybind.hpp"
#include <array>
#include <string_view>
#include <utility>

namespace loop {

namespace {

constexpr std::array<std::pair<CustomAnchor, std::string_view>, 10> ANCHOR_NAMES = { {
    { CustomAnchor::TopLeft, "top_left" },
    { CustomAnchor::Top, "top" },
    { CustomAnchor::TopRight, "top_right" },
    { CustomAnchor::Right, "right" },
    { CustomAnchor::BottomRight, "bottom_right" },
    { CustomAnchor::Bottom, "bottom" },
    { CustomAnchor::BottomLeft, "bottom_left" },
    { CustomAnchor::Left, "left" },
    { CustomAnchor::Center, "center" },
    { CustomAnchor::MacOSCenter, "macos_center" },
} };

constexpr std::array<std::pair<SizeMode, std::string_view>, 3> SIZE_MODE_NAMES = { {
    { SizeMode::Custom, "custom" },
    { SizeMode::PreserveSize, "preserve_size" },
    { SizeMode::InitialSize, "initial_size" },
} };

template<typename Enum, size_t N>
std::optional<Enum> enum_from_name(std::array<std::pair<Enum, std::string_view>, N> const& names, std::string_view name)
{
    for (auto const& [value, text] : names)
    {
        if (text == name)
            return value;
    }
    return std::nullopt;
}

template<typename Enum, size_t N>
std::string_view enum_name(std::array<std::pair<Enum, std::string_view>, N> const& names, Enum value)
{
    for (auto const& [candidate, text] : names)
    {
        if (candidate == value)
            return text;
    }
    return names.front().second;
}

bool read_keys(toml::table const& table, KeySet& keys, std::string& error)
{
    auto array = table["keys"].as_array();
    if (!array)
        return true;

    for (auto const& item : *array)
    {
        auto name = item.value<std::string>();
        if (!name)
            continue;
        auto key = parse_key(*name);
        if (!key)
        {
            error = "unknown key name '" + *name + "'";
            return false;
        }
        keys.insert(*key);
    }
    return true;
}

bool read_custom(toml::table const& table, CustomFrame& frame, std::string& error)
{
    if (auto v = table["unit"].value<std::string>())
    {
        if (*v == "pixels")
            frame.unit = CustomUnit::Pixels;
        else if (*v == "percentage")
            frame.unit = CustomUnit::Percentage;
        else
        {
            error = "unknown unit '" + *v + "'";
            return false;
        }
    }
    if (auto v = table["anchor"].value<std::string>())
    {
        auto anchor = enum_from_name(ANCHOR_NAMES, *v);
        if (!anchor)
        {
            error = "unknown anchor '" + *v + "'";
            return false;
        }
        frame.anchor = *anchor;
    }
    if (auto v = table["size_mode"].value<std::string>())
    {
        auto mode = enum_from_name(SIZE_MODE_NAMES, *v);
        if (!mode)
        {
            error = "unknown size mode '" + *v + "'";
            return false;
        }
        frame.size_mode = *mode;
    }
    if (auto v = table["position_mode"].value<std::string>())
        frame.position_mode = *v == "coordinates" ? PositionMode::Coordinates : PositionMode::Generic;

    frame.width = table["width"].value<double>();
    frame.height = table["height"].value<double>();
    frame.x = table["x"].value<double>();
    frame.y = table["y"].value<double>();
    return true;
}

} // namespace

std::optional<Action> action_from_toml(toml::table const& table, std::string& error)
{
    auto direction_name = table["direction"].value<std::string>();
    if (!direction_name)
    {
        error = "action without a direction";
        return std::nullopt;
    }

    auto direction = direction_from_string(*direction_name);
    if (!direction)
    {
        error = "unknown direction '" + *direction_name + "'";
        return std::nullopt;
    }

    KeySet keys;
    if (!read_keys(table, keys, error))
        return std::nullopt;

    auto name = table["name"].value<std::string>();

    if (*direction == Direction::Cycle)
    {
        std::vector<Action> members;
        if (auto cycle = table["cycle"].as_array())
        {
            for (auto const& item : *cycle)
            {
                auto member_table = item.as_table();
                if (!member_table)
                    continue;
                auto member = action_from_toml(*member_table, error);
                if (!member)
                    return std::nullopt;
                members.push_back(std::move(*member));
            }
        }
        return make_cycle_action(std::move(members), std::move(keys), std::move(name));
    }

    if (is_customizable(*direction))
    {
        CustomFrame frame;
        if (!read_custom(table, frame, error))
            return std::nullopt;
        return make_custom_action(*direction, frame, std::move(keys), std::move(name));
    }

    Action action = make_action(*direction, std::move(keys));
    action.name = std::move(name);
    return action;
}

toml::table action_to_toml(Action const& action)
{
    toml::table table;
    table.insert("direction", std::string(to_string(action.direction)));

    if (!action.keybind.empty())
    {
        toml::array keys;
        for (Key key : action.keybind)
            keys.push_back(key_name(key));
        table.insert("keys", std::move(keys));
    }
    if (action.name)
        table.insert("name", *action.name);

    if (auto const* frame = action.custom())
    {
        table.insert("unit", frame->unit == CustomUnit::Pixels ? "pixels" : "percentage");
        table.insert("anchor", std::string(enum_name(ANCHOR_NAMES, frame->anchor)));
        table.insert("size_mode", std::string(enum_name(SIZE_MODE_NAMES, frame->size_mode)));
        table.insert("position_mode", frame->position_mode == PositionMode::Coordinates ? "coordinates" : "generic");
        if (frame->width)
            table.insert("width", *frame->width);
        if (frame->height)
            table.insert("height", *frame->height);
        if (frame->x)
            table.insert("x", *frame->x);
        if (frame->y)
            table.insert("y", *frame->y);
    }

    if (auto const* members = action.cycle_members())
    {
        toml::array cycle;
        for (auto const& member : *members)
            cycle.push_back(action_to_toml(member));
        table.insert("cycle", std::move(cycle));
    }
    return table;
}

} // namespace loop
