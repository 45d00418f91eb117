#include <cstdlib>
#include <filesystem>
#include <loop/config/config.hpp>
#include <loop/config/state_file.hpp>
#include <loop/core/log.hpp>
#include <loop/daemon.hpp>
#include <string>

namespace fs = std::filesystem;

namespace {

fs::path config_path(int argc, char* argv[])
{
    // Command line argument takes priority
    if (argc > 1)
        return argv[1];

    if (char const* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return fs::path(xdg) / "loop" / "config.toml";

    if (char const* home = std::getenv("HOME"))
        return fs::path(home) / ".config" / "loop" / "config.toml";

    return {};
}

loop::Config initial_config(fs::path const& path)
{
    if (path.empty() || !fs::exists(path))
    {
        LOG_INFO("No config file found, using defaults");
        return loop::default_config();
    }

    LOG_INFO("Loading config from: {}", path.string());
    if (auto loaded = loop::load_config(path.string()))
        return *loaded;

    LOG_WARN("Failed to load config, using defaults");
    return loop::default_config();
}

} // namespace

int main(int argc, char* argv[])
{
    loop::log::init();

    int status = 0;
    try
    {
        LOG_INFO("Starting loop");

        fs::path path = config_path(argc, argv);
        loop::Daemon daemon(initial_config(path), path.string(), loop::default_state_path());
        daemon.run();
        LOG_INFO("loop exiting");
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Error: {}", e.what());
        status = 1;
    }

    loop::log::shutdown();
    return status;
}
