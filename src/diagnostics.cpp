/// \file diagnostics.cpp
/// \brief Implementation of shared diagnostics/logging helpers.

#include <weave/diagnostics.hpp>

#include <atomic>
#include <iostream>
#include <mutex>

namespace weave::diagnostics {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Warning};
std::mutex g_io_mutex;
PerformanceCounters g_counters;  // guarded by g_io_mutex

} // namespace

std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Error:   return "error";
        case LogLevel::Warning: return "warning";
        case LogLevel::Info:    return "info";
        case LogLevel::Debug:   return "debug";
        case LogLevel::Trace:   return "trace";
    }
    return "unknown";
}

Result<LogLevel> parse_log_level(std::string_view text) {
    for (auto level : {LogLevel::Error, LogLevel::Warning, LogLevel::Info,
                       LogLevel::Debug, LogLevel::Trace}) {
        if (text == log_level_name(level))
            return level;
    }
    return std::unexpected(Error::validation("Unknown log level", std::string(text)));
}

Status set_log_level(LogLevel level) {
    g_level.store(level, std::memory_order_relaxed);
    return weave::ok();
}

LogLevel log_level() {
    return g_level.load(std::memory_order_relaxed);
}

void log(LogLevel level, std::string_view domain, std::string_view message) {
    if (static_cast<int>(level) > static_cast<int>(log_level()))
        return;

    std::lock_guard<std::mutex> lock(g_io_mutex);
    std::cerr << "[weave][" << log_level_name(level) << "][" << domain << "] "
              << message << "\n";
    ++g_counters.log_messages;
}

void log_error(LogLevel level, std::string_view domain, const Error& error) {
    std::string line = std::string(category_name(error.category)) + ": " + error.message;
    if (!error.context.empty())
        line += " [" + error.context + "]";
    log(level, domain, line);
}

Error enrich(Error base, std::string_view context_suffix) {
    if (!base.context.empty())
        base.context += " | ";
    base.context += std::string(context_suffix);
    return base;
}

Status assert_invariant(bool condition, std::string_view message) {
    if (condition)
        return weave::ok();

    {
        std::lock_guard<std::mutex> lock(g_io_mutex);
        ++g_counters.invariant_failures;
    }
    log(LogLevel::Error, "invariant", message);
    return std::unexpected(Error::internal("Invariant failed", std::string(message)));
}

void reset_performance_counters() {
    std::lock_guard<std::mutex> lock(g_io_mutex);
    g_counters = {};
}

PerformanceCounters performance_counters() {
    std::lock_guard<std::mutex> lock(g_io_mutex);
    return g_counters;
}

} // namespace weave::diagnostics
