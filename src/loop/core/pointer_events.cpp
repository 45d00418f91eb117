#include "pointer_events.hpp"
#include "log.hpp"
#include <vector>

namespace loop {

PointerEvents::Subscription PointerEvents::subscribe(Listener listener)
{
    uint64_t id = next_id_++;
    bool first = listeners_.empty();
    listeners_[id] = std::move(listener);

    if (first && source_)
    {
        LOG_DEBUG("Starting pointer source");
        source_->start();
    }
    return Subscription(this, id);
}

void PointerEvents::unsubscribe(uint64_t id)
{
    if (listeners_.erase(id) == 0)
        return;

    if (listeners_.empty() && source_)
    {
        LOG_DEBUG("Stopping pointer source");
        source_->stop();
    }
}

void PointerEvents::dispatch(PointerEvent const& event)
{
    std::vector<uint64_t> ids;
    ids.reserve(listeners_.size());
    for (auto const& [id, listener] : listeners_)
        ids.push_back(id);

    for (uint64_t id : ids)
    {
        auto it = listeners_.find(id);
        if (it == listeners_.end())
            continue;
        // Copy: the listener may unsubscribe itself while running
        Listener listener = it->second;
        listener(event);
    }
}

} // namespace loop
