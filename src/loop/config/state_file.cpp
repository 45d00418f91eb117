#include "state_file.hpp"
#include "action_toml.hpp"
#include "loop/core/log.hpp"
#include <cstdlib>
#include <fstream>
#include <system_error>
#include <toml++/toml.hpp>

namespace loop {

StateFile::StateFile(std::optional<std::filesystem::path> path)
    : path_(std::move(path))
{
    load();
}

void StateFile::increment_times_looped()
{
    ++times_looped_;
    save();
}

void StateFile::set_stash(std::map<WindowId, Action> stashed, std::set<WindowId> revealed)
{
    stashed_ = std::move(stashed);
    revealed_ = std::move(revealed);
    save();
}

void StateFile::load()
{
    if (!path_)
        return;

    std::error_code ec;
    if (!std::filesystem::exists(*path_, ec))
        return;

    try
    {
        auto tbl = toml::parse_file(path_->string());

        if (auto v = tbl["times_looped"].value<int64_t>())
            times_looped_ = static_cast<uint64_t>(*v);

        if (auto stash = tbl["stash"].as_table())
        {
            if (auto revealed = (*stash)["revealed"].as_array())
            {
                for (auto const& item : *revealed)
                {
                    if (auto id = item.value<int64_t>())
                        revealed_.insert(static_cast<WindowId>(*id));
                }
            }

            if (auto windows = (*stash)["windows"].as_array())
            {
                for (auto const& item : *windows)
                {
                    auto entry = item.as_table();
                    if (!entry)
                        continue;
                    auto id = (*entry)["id"].value<int64_t>();
                    auto action_table = (*entry)["action"].as_table();
                    if (!id || !action_table)
                        continue;

                    std::string error;
                    if (auto action = action_from_toml(*action_table, error))
                        stashed_.emplace(static_cast<WindowId>(*id), std::move(*action));
                    else
                        LOG_WARN("State file: skipping stashed window {:#x}: {}", *id, error);
                }
            }
        }
        LOG_DEBUG("Loaded state from {} ({} stashed)", path_->string(), stashed_.size());
    }
    catch (toml::parse_error const& err)
    {
        LOG_WARN("State file parse error: {}", err.description());
    }
}

void StateFile::save() const
{
    if (!path_)
        return;

    toml::table tbl;
    tbl.insert("times_looped", static_cast<int64_t>(times_looped_));

    toml::array revealed;
    for (WindowId id : revealed_)
        revealed.push_back(static_cast<int64_t>(id));

    toml::array windows;
    for (auto const& [id, action] : stashed_)
    {
        toml::table entry;
        entry.insert("id", static_cast<int64_t>(id));
        entry.insert("action", action_to_toml(action));
        windows.push_back(std::move(entry));
    }

    toml::table stash;
    stash.insert("revealed", std::move(revealed));
    stash.insert("windows", std::move(windows));
    tbl.insert("stash", std::move(stash));

    std::error_code ec;
    std::filesystem::create_directories(path_->parent_path(), ec);
    if (ec)
    {
        LOG_WARN("Cannot create {}: {}", path_->parent_path().string(), ec.message());
        return;
    }

    std::ofstream out(*path_, std::ios::trunc);
    if (!out)
    {
        LOG_WARN("Cannot write state file {}", path_->string());
        return;
    }
    out << tbl << '\n';
}

std::optional<std::filesystem::path> default_state_path()
{
    if (char const* state = std::getenv("XDG_STATE_HOME"); state && *state)
        return std::filesystem::path(state) / "loop" / "state.toml";
    if (char const* home = std::getenv("HOME"))
        return std::filesystem::path(home) / ".local" / "state" / "loop" / "state.toml";
    return std::nullopt;
}

} // namespace loop
