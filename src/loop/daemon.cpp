#include "daemon.hpp"
#include "loop/core/log.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <poll.h>
#include <unistd.h>

namespace loop {

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;
volatile std::sig_atomic_t g_reload_requested = 0;
int g_wake_fd = -1;

void wake()
{
    if (g_wake_fd < 0)
        return;
    uint64_t one = 1;
    [[maybe_unused]] ssize_t written = write(g_wake_fd, &one, sizeof(one));
}

void stop_handler(int /*sig*/)
{
    g_stop_requested = 1;
    wake();
}

void reload_handler(int /*sig*/)
{
    g_reload_requested = 1;
    wake();
}

void setup_signal_handlers(int wake_fd)
{
    g_wake_fd = wake_fd;

    struct sigaction sa = {};
    sa.sa_handler = stop_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    sa.sa_handler = reload_handler;
    sigaction(SIGHUP, &sa, nullptr);
}

} // namespace

Daemon::Daemon(Config config, std::string config_path, std::optional<std::filesystem::path> state_path)
    : config_(std::move(config))
    , config_path_(std::move(config_path))
    , conn_()
    , ewmh_(conn_)
    , windows_(conn_, ewmh_)
    , scheduler_()
    , poller_(scheduler_, [this](PointerEvent const& event) { pointer_events_.dispatch(event); })
    , pointer_events_(&poller_)
    , state_(std::move(state_path))
    , animator_(scheduler_)
    , stash_store_(state_)
    , stash_(config_, windows_, history_, animator_, scheduler_, pointer_events_, stash_store_)
    , engine_(config_, windows_, history_, animator_, stash_)
    , session_(config_, windows_, engine_, stash_, history_, pointer_events_, state_)
    , keybinds_(
          config_,
          cache_,
          TriggerCallbacks{
              .open = [this](std::optional<Action> action) { session_.open(action); },
              .close = [this](bool force) { session_.close(force); },
              .is_open = [this]() { return session_.active(); },
              .shift_changed = [this](bool pressed) { session_.set_shift_pressed(pressed); },
          }
      )
    , middle_click_(
          config_,
          scheduler_,
          pointer_events_,
          [this]() { session_.open(std::nullopt); },
          [this](bool force) { session_.close(force); }
      )
    , drag_(config_, windows_, engine_, history_, stash_, pointer_events_)
    , grabber_(conn_, config_, scheduler_, [this](KeyEvent const& event) { return keybinds_.handle(event); })
{
    setup_signal_handlers(scheduler_.wake_fd());
    cache_.rebuild(config_.actions, config_.behavior.cycle_backwards_on_shift);

    session_.set_hooks(SessionController::Hooks{
        .pointer_moved = [this]() { keybinds_.set_passthrough_allowed(false); },
        .active_changed =
            [this](bool active) {
                grabber_.set_keyboard_grabbed(active);
                if (!active)
                    keybinds_.reset();
            },
    });

    conn_.watch_root();
    stash_.start();
    drag_.start();
    if (config_.trigger.middle_click)
        middle_click_.start();
    grabber_.grab();

    LOG_INFO("Loaded {} actions, {} keybinds, {} screens", config_.actions.size(), cache_.size(), windows_.screens().size());
    conn_.flush();
}

Daemon::~Daemon()
{
    g_wake_fd = -1;
}

void Daemon::run()
{
    pollfd fds[2] = {};
    fds[0].fd = conn_.file_descriptor();
    fds[0].events = POLLIN;
    fds[1].fd = scheduler_.wake_fd();
    fds[1].events = POLLIN;

    while (running_)
    {
        int poll_result = poll(fds, 2, scheduler_.poll_timeout_ms());
        if (poll_result < 0 && errno != EINTR)
        {
            LOG_ERROR("poll failed: {}", std::strerror(errno));
            break;
        }

        handle_signals();

        for (;;)
        {
            KeyGrabber::EventPtr eventPtr = grabber_.take_deferred();
            if (!eventPtr)
                eventPtr.reset(xcb_poll_for_event(conn_.get()));
            if (!eventPtr)
                break;
            handle_event(*eventPtr);
        }

        scheduler_.run_pending();
        conn_.flush();

        if (conn_.has_error())
        {
            LOG_ERROR("X connection lost");
            break;
        }
    }

    if (session_.active())
        session_.close(true);
    stash_.restore_all(false);
    conn_.flush();
}

void Daemon::handle_signals()
{
    if (g_stop_requested)
    {
        LOG_INFO("Termination requested");
        running_ = false;
        return;
    }

    if (g_reload_requested)
    {
        g_reload_requested = 0;
        reload_config();
    }
}

void Daemon::reload_config()
{
    if (config_path_.empty() || !std::filesystem::exists(config_path_))
    {
        LOG_WARN("No config file to reload");
        return;
    }

    auto loaded = load_config(config_path_);
    if (!loaded)
    {
        LOG_WARN("Config reload failed, keeping the current configuration");
        return;
    }

    if (session_.active())
        session_.close(true);

    config_ = std::move(*loaded);
    cache_.rebuild(config_.actions, config_.behavior.cycle_backwards_on_shift);
    keybinds_.reset();
    stash_.on_configuration_changed();

    if (config_.trigger.middle_click)
        middle_click_.start();
    else
        middle_click_.stop();

    grabber_.grab();
    LOG_INFO("Config reloaded from {} ({} keybinds)", config_path_, cache_.size());
}

void Daemon::on_screens_changed()
{
    windows_.invalidate_screens();
    stash_.on_configuration_changed();
}

void Daemon::handle_event(xcb_generic_event_t const& event)
{
    if (grabber_.handle_event(event))
        return;

    uint8_t response_type = event.response_type & ~0x80;

    if (conn_.is_screen_change(response_type))
    {
        LOG_DEBUG("RandR screen change");
        on_screens_changed();
        return;
    }

    switch (response_type)
    {
        case XCB_PROPERTY_NOTIFY:
            handle_property_notify(reinterpret_cast<xcb_property_notify_event_t const&>(event));
            break;
        case XCB_MAPPING_NOTIFY:
        {
            auto* mapping = const_cast<xcb_mapping_notify_event_t*>(
                reinterpret_cast<xcb_mapping_notify_event_t const*>(&event)
            );
            if (conn_.refresh_mapping(mapping))
            {
                LOG_DEBUG("Keyboard mapping changed, regrabbing trigger");
                grabber_.grab();
            }
            break;
        }
        case 0:
        {
            auto const& error = reinterpret_cast<xcb_generic_error_t const&>(event);
            LOG_DEBUG("X error {} for request {}", error.error_code, error.major_code);
            break;
        }
        default:
            break;
    }
}

void Daemon::handle_property_notify(xcb_property_notify_event_t const& event)
{
    if (event.window != conn_.root())
        return;

    auto* ewmh = ewmh_.get();
    if (event.atom == ewmh->_NET_CURRENT_DESKTOP)
    {
        windows_.invalidate_screens();
        stash_.on_desktop_changed();
    }
    else if (event.atom == ewmh->_NET_WORKAREA)
    {
        on_screens_changed();
    }
    else if (event.atom == ewmh->_NET_SUPPORTED)
    {
        ewmh_.refresh_supported();
    }
}

} // namespace loop
