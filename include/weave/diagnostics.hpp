/// \file diagnostics.hpp
/// \brief Shared diagnostics, logging, and lightweight counters.

#ifndef WEAVE_DIAGNOSTICS_HPP
#define WEAVE_DIAGNOSTICS_HPP

#include <weave/error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace weave::diagnostics {

enum class LogLevel {
    Error = 0,
    Warning,
    Info,
    Debug,
    Trace,
};

struct PerformanceCounters {
    std::uint64_t log_messages{0};
    std::uint64_t invariant_failures{0};
};

Status set_log_level(LogLevel level);
LogLevel log_level();

/// Parse a level name ("error", "warning", "info", "debug", "trace").
Result<LogLevel> parse_log_level(std::string_view text);
std::string_view log_level_name(LogLevel level);

void log(LogLevel level, std::string_view domain, std::string_view message);

/// Log an error value with its category and context.
void log_error(LogLevel level, std::string_view domain, const Error& error);

/// Enrich an existing error with additional context text.
Error enrich(Error base, std::string_view context_suffix);

/// Assertion-like invariant helper for non-obvious runtime expectations.
Status assert_invariant(bool condition, std::string_view message);

void reset_performance_counters();
PerformanceCounters performance_counters();

} // namespace weave::diagnostics

#endif // WEAVE_DIAGNOSTICS_HPP
