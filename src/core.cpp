/// \file core.cpp
/// \brief Runtime configuration.

#include <weave/core.hpp>

#include <cstdlib>

namespace weave {

Status configure(const RuntimeOptions& options) {
    return diagnostics::set_log_level(options.log_level);
}

Result<RuntimeOptions> runtime_options_from_environment() {
    RuntimeOptions options;
    const char* level = std::getenv("WEAVE_LOG_LEVEL");
    if (level == nullptr || *level == '\0')
        return options;

    auto parsed = diagnostics::parse_log_level(level);
    if (!parsed)
        return std::unexpected(diagnostics::enrich(parsed.error(), "WEAVE_LOG_LEVEL"));
    options.log_level = *parsed;
    return options;
}

} // namespace weave
