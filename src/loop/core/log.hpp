#pragma once

// Logging for loop using spdlog
//
// Log levels (compile-time filtered via SPDLOG_ACTIVE_LEVEL):
//   - TRACE: Very verbose, per-event logging (e.g., every key or pointer event)
//   - DEBUG: Detailed debugging info (e.g., preview frames, stash decisions)
//   - INFO:  Normal operational messages (e.g., session opened, action applied)
//   - WARN:  Warning conditions (e.g., key grab refused, state file unreadable)
//   - ERROR: Error conditions
//
// In Release builds: TRACE and DEBUG are compiled out (zero cost)
// In Debug builds: All levels are active
//
// Usage:
//   LOG_DEBUG("Resolved frame for {:#x}", window_id);
//   LOG_INFO("Window action changed: {}", name);

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <string>

namespace loop::log {

// Initialize logging - call once at startup.
// SPDLOG_LEVEL in the environment lowers the runtime level (e.g. SPDLOG_LEVEL=info).
inline void init(std::string const& file_path = "/tmp/loop.log")
{
    // Create console sink (stderr) with colors
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    // Create file sink for persistent logs
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, true);
    file_sink->set_level(spdlog::level::trace);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");

    auto logger = std::make_shared<spdlog::logger>("loop", spdlog::sinks_init_list{console_sink, file_sink});
    logger->set_level(spdlog::level::trace);  // Runtime level (compile-time is separate)
    logger->flush_on(spdlog::level::debug);

    spdlog::set_default_logger(logger);
    spdlog::cfg::load_env_levels();
}

// Shutdown logging - call at exit
inline void shutdown()
{
    spdlog::shutdown();
}

} // namespace loop::log

// Convenience macros using spdlog's compile-time filtered macros
// These are zero-cost when level is below SPDLOG_ACTIVE_LEVEL

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

// Rect logging helper (debug level)
#define LOG_RECT(what, r) \
    SPDLOG_DEBUG("{}: ({}, {}, {}x{})", what, (r).x, (r).y, (r).width, (r).height)
