/// \file core.hpp
/// \brief Shared option and configuration structs used across weave domains.

#ifndef WEAVE_CORE_HPP
#define WEAVE_CORE_HPP

#include <weave/diagnostics.hpp>
#include <weave/error.hpp>

#include <cstddef>
#include <string_view>

namespace weave {

/// Package whose paths caption by their last segment only.
inline constexpr std::string_view kStandardPackage = "std";

/// Prefix used when a path is rendered relative to its own package root.
inline constexpr std::string_view kPackageRootKeyword = "crate";

/// Version assigned to a freshly created store.
inline constexpr std::string_view kInitialPackageVersion = "0.0.0";

/// Process-wide runtime settings.
struct RuntimeOptions {
    diagnostics::LogLevel log_level{diagnostics::LogLevel::Warning};
};

/// Policy for the compatibility-check driver.
struct CheckOptions {
    bool        parallel_environments{true};
    std::size_t max_threads{0};      ///< 0 means one thread per environment.
    bool        skip_processed{false}; ///< Leave items already consumed by generation alone.
};

/// Apply runtime settings (currently the log level).
Status configure(const RuntimeOptions& options);

/// Build runtime settings from the WEAVE_LOG_LEVEL environment variable.
/// An unset variable yields the defaults; an unknown level name is an error.
Result<RuntimeOptions> runtime_options_from_environment();

} // namespace weave

#endif // WEAVE_CORE_HPP
