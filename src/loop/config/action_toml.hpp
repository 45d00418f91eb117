#pragma once

#include "loop/core/action.hpp"
#include <optional>
#include <string>
#include <toml++/toml.hpp>

namespace loop {

/**
 * @brief Reads an action table
 *
 *   direction = "Custom"            # required, see Direction names
 *   keys = ["Up", "Right"]
 *   name = "Top Right"
 *   unit = "percentage"             # custom only: "percentage" | "pixels"
 *   anchor = "center"               # top_left, top, ..., center, macos_center
 *   size_mode = "custom"            # custom | preserve_size | initial_size
 *   width = 80
 *   height = 80
 *   position_mode = "generic"       # generic | coordinates
 *   x = 10
 *   y = 10
 *   cycle = [{ direction = "TopHalf" }, { direction = "TopThird" }]
 *
 * On failure returns nullopt and describes the problem in error.
 */
std::optional<Action> action_from_toml(toml::table const& table, std::string& error);

toml::table action_to_toml(Action const& action);

} // namespace loop
