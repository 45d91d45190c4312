/// \file error.hpp
/// \brief Core error and result types for weave.
///
/// Provides weave::Error, weave::Result<T>, and weave::Status as the
/// canonical error model used by every weave namespace.

#ifndef WEAVE_ERROR_HPP
#define WEAVE_ERROR_HPP

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace weave {

// ── Error category ──────────────────────────────────────────────────────

/// Broad classification of an error's origin.
enum class ErrorCategory {
    Validation,       ///< Caller-supplied argument was malformed.
    NotFound,         ///< The requested item or path does not exist.
    PathError,        ///< A surface item cannot be placed at its path.
    PackageMismatch,  ///< The item belongs to a different package.
    ConversionError,  ///< A type conversion does not apply to this type.
    Internal,         ///< Bug inside weave itself.
};

// ── Error ───────────────────────────────────────────────────────────────

/// Structured error value carried through every Result / Status.
struct Error {
    ErrorCategory category{ErrorCategory::Internal};
    int           code{0};
    std::string   message;
    std::string   context;

    /// Convenience constructors.
    static Error validation(std::string msg, std::string ctx = {}) {
        return {ErrorCategory::Validation, 0, std::move(msg), std::move(ctx)};
    }
    static Error not_found(std::string msg, std::string ctx = {}) {
        return {ErrorCategory::NotFound, 0, std::move(msg), std::move(ctx)};
    }
    static Error path(std::string msg, std::string ctx = {}) {
        return {ErrorCategory::PathError, 0, std::move(msg), std::move(ctx)};
    }
    static Error package_mismatch(std::string msg, std::string ctx = {}) {
        return {ErrorCategory::PackageMismatch, 0, std::move(msg), std::move(ctx)};
    }
    static Error conversion(std::string msg, std::string ctx = {}) {
        return {ErrorCategory::ConversionError, 0, std::move(msg), std::move(ctx)};
    }
    static Error internal(std::string msg, std::string ctx = {}) {
        return {ErrorCategory::Internal, 0, std::move(msg), std::move(ctx)};
    }
};

/// Short lowercase name of a category, for log lines.
std::string_view category_name(ErrorCategory category);

// ── Result / Status aliases ─────────────────────────────────────────────

/// A value-or-error return type.
template <typename T>
using Result = std::expected<T, Error>;

/// A void-or-error return type (for operations that succeed or fail).
using Status = std::expected<void, Error>;

/// Helper: return a successful void Status.
inline Status ok() { return {}; }

} // namespace weave

#endif // WEAVE_ERROR_HPP
