#pragma once

#include "loop/core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

namespace loop {

enum class PointerEventType
{
    Moved,
    ButtonDown,
    ButtonUp,
};

struct PointerEvent
{
    PointerEventType type = PointerEventType::Moved;
    Point position;
    uint8_t button = 0;     ///< X button number for ButtonDown/ButtonUp (1 left, 2 middle, 3 right)
    uint16_t buttons = 0;   ///< Held buttons after the event, bit (n - 1) for button n
    bool hardware = true;   ///< False for synthesised events

    bool left_held() const { return buttons & 1u; }
};

/// Producer of raw pointer events. Runs only while someone listens.
class PointerSource
{
public:
    virtual ~PointerSource() = default;
    virtual void start() = 0;
    virtual void stop() = 0;
};

/**
 * @brief Listener registry for pointer events
 *
 * Dispatch happens on the scheduler thread. Removing a listener takes effect
 * immediately, even in the middle of a dispatch. The source is started with the
 * first subscription and stopped when the last one goes away.
 */
class PointerEvents
{
public:
    using Listener = std::function<void(PointerEvent const&)>;

    class Subscription
    {
    public:
        Subscription() = default;
        Subscription(PointerEvents* owner, uint64_t id)
            : owner_(owner)
            , id_(id)
        {
        }
        ~Subscription() { reset(); }

        Subscription(Subscription&& other) noexcept
            : owner_(other.owner_)
            , id_(other.id_)
        {
            other.owner_ = nullptr;
        }
        Subscription& operator=(Subscription&& other) noexcept
        {
            if (this != &other)
            {
                reset();
                owner_ = other.owner_;
                id_ = other.id_;
                other.owner_ = nullptr;
            }
            return *this;
        }
        Subscription(Subscription const&) = delete;
        Subscription& operator=(Subscription const&) = delete;

        void reset()
        {
            if (owner_)
            {
                owner_->unsubscribe(id_);
                owner_ = nullptr;
            }
        }
        bool active() const { return owner_ != nullptr; }

    private:
        PointerEvents* owner_ = nullptr;
        uint64_t id_ = 0;
    };

    explicit PointerEvents(PointerSource* source = nullptr)
        : source_(source)
    {
    }

    [[nodiscard]] Subscription subscribe(Listener listener);
    void dispatch(PointerEvent const& event);
    size_t listener_count() const { return listeners_.size(); }

private:
    void unsubscribe(uint64_t id);

    PointerSource* source_ = nullptr;
    std::map<uint64_t, Listener> listeners_;
    uint64_t next_id_ = 1;
};

} // namespace loop
