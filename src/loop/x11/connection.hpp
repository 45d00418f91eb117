#pragma once

#include <memory>
#include <xcb/randr.h>
#include <xcb/xcb.h>
#include <xcb/xcb_keysyms.h>

namespace loop {

/**
 * @brief Client connection to the X server
 *
 * Owns the xcb connection and the key symbol table. loop never manages
 * windows itself, so the root window only ever gets PropertyNotify and RandR
 * screen-change selections.
 */
class Connection
{
public:
    /// Connects to display, or $DISPLAY when null. Throws std::runtime_error.
    explicit Connection(char const* display = nullptr);

    Connection(Connection const&) = delete;
    Connection& operator=(Connection const&) = delete;

    xcb_connection_t* get() const { return conn_.get(); }
    xcb_screen_t* screen() const { return screen_; }
    xcb_window_t root() const { return screen_->root; }
    xcb_key_symbols_t* keysyms() const { return keysyms_.get(); }

    bool has_randr() const { return randr_event_base_ >= 0; }
    bool has_error() const { return xcb_connection_has_error(conn_.get()) != 0; }
    int file_descriptor() const { return xcb_get_file_descriptor(conn_.get()); }

    void flush() { xcb_flush(conn_.get()); }

    /// Root property changes (active window, stacking, workarea, desktop) and monitor layout changes.
    void watch_root();

    bool is_screen_change(uint8_t response_type) const
    {
        return has_randr() && response_type == randr_event_base_ + XCB_RANDR_SCREEN_CHANGE_NOTIFY;
    }

    /// Applies a MappingNotify; true when the keyboard mapping changed.
    bool refresh_mapping(xcb_mapping_notify_event_t* event);

private:
    std::unique_ptr<xcb_connection_t, decltype(&xcb_disconnect)> conn_;
    xcb_screen_t* screen_ = nullptr;
    std::unique_ptr<xcb_key_symbols_t, decltype(&xcb_key_symbols_free)> keysyms_;
    int randr_event_base_ = -1;
};

} // namespace loop
