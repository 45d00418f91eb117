#include "stash_store.hpp"
#include "loop/core/log.hpp"
#include "loop/core/screen.hpp"
#include <algorithm>

namespace loop {

namespace {

std::optional<StashedWindow> attach(
    WindowId id,
    Action const& action,
    std::vector<WindowPtr> const& windows,
    std::vector<Screen> const& screens
)
{
    auto it = std::find_if(windows.begin(), windows.end(), [id](WindowPtr const& w) { return w->id() == id; });
    if (it == windows.end() || screens.empty())
        return std::nullopt;

    Screen const* screen = screens::screen_containing(screens, (*it)->frame());
    return StashedWindow{ *it, screen ? *screen : screens.front(), action };
}

} // namespace

StashStore::StashStore(StateFile& state)
    : state_(state)
{
}

StashedWindow const* StashStore::find(WindowId id) const
{
    auto it = stashed_.find(id);
    return it != stashed_.end() ? &it->second : nullptr;
}

void StashStore::insert(StashedWindow window)
{
    WindowId id = window.id();
    pending_.erase(id);
    stashed_.insert_or_assign(id, std::move(window));
    persist();
}

void StashStore::erase(WindowId id)
{
    if (stashed_.erase(id) > 0)
        persist();
}

void StashStore::mark_revealed(WindowId id)
{
    if (revealed_.insert(id).second)
        persist();
}

void StashStore::mark_hidden(WindowId id)
{
    if (revealed_.erase(id) > 0)
        persist();
}

StashedWindow const* StashStore::find_by_placement(Action const& action, Screen const& screen) const
{
    for (auto const& [id, window] : stashed_)
    {
        if (same_manipulation(window.action, action) && window.screen == screen)
            return &window;
    }
    return nullptr;
}

size_t StashStore::restore(std::vector<WindowPtr> const& windows, std::vector<Screen> const& screens)
{
    revealed_ = state_.revealed();
    stashed_.clear();
    pending_.clear();

    for (auto const& [id, action] : state_.stashed())
    {
        if (auto window = attach(id, action, windows, screens))
            stashed_.insert_or_assign(id, std::move(*window));
        else
            pending_.emplace(id, action);
    }

    if (!stashed_.empty())
        LOG_INFO("{} stashed window(s) restored", stashed_.size());
    if (!pending_.empty())
        LOG_WARN("Failed to restore {} stashed window(s), retrying on desktop change", pending_.size());

    persist();
    return stashed_.size();
}

size_t StashStore::retry_restore(std::vector<WindowPtr> const& windows, std::vector<Screen> const& screens)
{
    size_t restored = 0;
    for (auto it = pending_.begin(); it != pending_.end();)
    {
        auto window = attach(it->first, it->second, windows, screens);
        if (!window)
        {
            ++it;
            continue;
        }
        stashed_.insert_or_assign(it->first, std::move(*window));
        it = pending_.erase(it);
        ++restored;
    }

    if (restored > 0)
    {
        LOG_INFO("{} pending stashed window(s) restored", restored);
        persist();
    }
    return restored;
}

void StashStore::update_screens(std::vector<Screen> const& screens)
{
    if (screens.empty())
        return;

    for (auto& [id, window] : stashed_)
    {
        auto it = std::find(screens.begin(), screens.end(), window.screen);
        if (it != screens.end())
        {
            window.screen = *it;
            continue;
        }

        Screen const* screen = screens::screen_containing(screens, window.window->frame());
        window.screen = screen ? *screen : screens.front();
        LOG_INFO("Stashed window {:#x} moved to screen {}", id, window.screen.name);
    }
}

void StashStore::persist()
{
    std::map<WindowId, Action> actions = pending_;
    for (auto const& [id, window] : stashed_)
        actions.insert_or_assign(id, window.action);
    state_.set_stash(std::move(actions), revealed_);
}

} // namespace loop
