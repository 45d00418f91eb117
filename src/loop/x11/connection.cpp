#include "connection.hpp"
#include "loop/core/log.hpp"
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace loop {

Connection::Connection(char const* display)
    : conn_(xcb_connect(display, nullptr), xcb_disconnect)
    , keysyms_(nullptr, xcb_key_symbols_free)
{
    if (xcb_connection_has_error(conn_.get()))
    {
        char const* name = display ? display : std::getenv("DISPLAY");
        throw std::runtime_error(std::string("Cannot open display ") + (name ? name : "(unset)"));
    }

    screen_ = xcb_setup_roots_iterator(xcb_get_setup(conn_.get())).data;
    if (!screen_)
        throw std::runtime_error("X server reported no screens");

    keysyms_.reset(xcb_key_symbols_alloc(conn_.get()));
    if (!keysyms_)
        throw std::runtime_error("Failed to allocate key symbols");

    // Without RandR the whole root window is one screen
    xcb_query_extension_reply_t const* randr = xcb_get_extension_data(conn_.get(), &xcb_randr_id);
    if (!randr || !randr->present)
        return;

    auto* version = xcb_randr_query_version_reply(
        conn_.get(),
        xcb_randr_query_version(conn_.get(), XCB_RANDR_MAJOR_VERSION, XCB_RANDR_MINOR_VERSION),
        nullptr
    );
    if (!version)
        return;

    LOG_DEBUG("RandR {}.{}", version->major_version, version->minor_version);
    free(version);
    randr_event_base_ = randr->first_event;
}

void Connection::watch_root()
{
    uint32_t values[] = { XCB_EVENT_MASK_PROPERTY_CHANGE };
    xcb_change_window_attributes(conn_.get(), root(), XCB_CW_EVENT_MASK, values);

    if (has_randr())
        xcb_randr_select_input(conn_.get(), root(), XCB_RANDR_NOTIFY_MASK_SCREEN_CHANGE);
    flush();
}

bool Connection::refresh_mapping(xcb_mapping_notify_event_t* event)
{
    xcb_refresh_keyboard_mapping(keysyms_.get(), event);
    return event->request == XCB_MAPPING_KEYBOARD;
}

} // namespace loop
