#include "pointer_poller.hpp"
#include "connection.hpp"
#include "loop/core/log.hpp"
#include <exception>
#include <iterator>

namespace loop {

namespace {

constexpr uint16_t BUTTON_MASKS[] = {
    XCB_BUTTON_MASK_1, XCB_BUTTON_MASK_2, XCB_BUTTON_MASK_3, XCB_BUTTON_MASK_4, XCB_BUTTON_MASK_5,
};

// Button n maps to bit (n - 1)
uint16_t buttons_from_mask(uint16_t mask)
{
    uint16_t buttons = 0;
    for (size_t i = 0; i < std::size(BUTTON_MASKS); ++i)
    {
        if (mask & BUTTON_MASKS[i])
            buttons |= static_cast<uint16_t>(1u << i);
    }
    return buttons;
}

} // namespace

PointerPoller::PointerPoller(Scheduler& scheduler, Sink sink, std::string display)
    : scheduler_(scheduler)
    , sink_(std::move(sink))
    , display_(std::move(display))
{
}

PointerPoller::~PointerPoller() { stop(); }

void PointerPoller::start()
{
    if (thread_.joinable())
        return;
    LOG_DEBUG("Pointer polling started");
    thread_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

void PointerPoller::stop()
{
    if (!thread_.joinable())
        return;
    thread_.request_stop();
    thread_.join();
    thread_ = std::jthread();
    LOG_DEBUG("Pointer polling stopped");
}

void PointerPoller::run(std::stop_token stop)
{
    std::unique_ptr<Connection> conn;
    try
    {
        conn = std::make_unique<Connection>(display_.empty() ? nullptr : display_.c_str());
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Pointer polling unavailable: {}", e.what());
        return;
    }

    bool first = true;
    Point last_position;
    uint16_t last_buttons = 0;

    auto post = [this](PointerEvent const& event) {
        bool droppable = event.type == PointerEventType::Moved;
        if (!scheduler_.post([sink = sink_, event]() { sink(event); }, droppable))
            LOG_WARN("Dropped pointer event, scheduler queue full");
    };

    while (!stop.stop_requested())
    {
        auto* reply = xcb_query_pointer_reply(conn->get(), xcb_query_pointer(conn->get(), conn->root()), nullptr);
        if (!reply)
        {
            if (conn->has_error())
            {
                LOG_ERROR("Pointer polling connection lost");
                return;
            }
            std::this_thread::sleep_for(POLL_INTERVAL);
            continue;
        }

        Point position{ static_cast<double>(reply->root_x), static_cast<double>(reply->root_y) };
        uint16_t buttons = buttons_from_mask(reply->mask);
        free(reply);

        if (first)
        {
            first = false;
            last_position = position;
            last_buttons = buttons;
        }

        // Button transitions first so moves carry the new mask
        for (uint8_t button = 1; button <= std::size(BUTTON_MASKS); ++button)
        {
            uint16_t bit = static_cast<uint16_t>(1u << (button - 1));
            if ((buttons & bit) == (last_buttons & bit))
                continue;

            PointerEvent event;
            event.type = (buttons & bit) ? PointerEventType::ButtonDown : PointerEventType::ButtonUp;
            event.position = position;
            event.button = button;
            event.buttons = buttons;
            post(event);
        }

        if (position != last_position)
        {
            PointerEvent event;
            event.type = PointerEventType::Moved;
            event.position = position;
            event.buttons = buttons;
            post(event);
        }

        last_position = position;
        last_buttons = buttons;
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
}

} // namespace loop
