/// \file check.hpp
/// \brief Per-environment compatibility ledger for FFI items.
///
/// Each FFI item carries a Ledger recording, per Environment, whether the
/// generated wrapper built and ran there. A failure is stored as data (its
/// error message); it is never raised as an Error.

#ifndef WEAVE_CHECK_HPP
#define WEAVE_CHECK_HPP

#include <weave/error.hpp>

#include <compare>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace weave::check {

// ── Environment ─────────────────────────────────────────────────────────

enum class Endian {
    Little,
    Big,
};

/// Platform target descriptor.
struct Target {
    std::string   arch;           ///< e.g. "x86_64", "aarch64".
    std::string   os;             ///< e.g. "linux", "macos", "windows".
    std::string   env;            ///< e.g. "gnu", "msvc"; may be empty.
    std::uint32_t pointer_width{64};
    Endian        endian{Endian::Little};

    /// Descriptor of the platform weave itself was built for.
    static Target host();

    /// "arch-os[-env]".
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const Target&, const Target&) = default;
    friend auto operator<=>(const Target&, const Target&) = default;
};

/// One configuration under which an FFI item is validated.
struct Environment {
    Target                     target;
    std::optional<std::string> library_version;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const Environment&, const Environment&) = default;
    friend auto operator<=>(const Environment&, const Environment&) = default;
};

// ── Ledger ──────────────────────────────────────────────────────────────

struct Entry {
    Environment                environment;
    std::optional<std::string> error;  ///< Empty on success.

    [[nodiscard]] bool passed() const noexcept { return !error.has_value(); }

    friend bool operator==(const Entry&, const Entry&) = default;
};

enum class RecordKind {
    Added,      ///< First result for this environment.
    Changed,    ///< Replaced a different earlier result.
    Unchanged,  ///< Same result as before; nothing was written.
};

struct RecordOutcome {
    RecordKind                 kind{RecordKind::Added};
    std::optional<std::string> previous_error;  ///< Set only for Changed.

    /// The environment used to pass and now fails.
    [[nodiscard]] bool is_regression(const std::optional<std::string>& new_error) const noexcept {
        return kind == RecordKind::Changed && !previous_error && new_error;
    }
    /// The environment used to fail and now passes.
    [[nodiscard]] bool is_fix(const std::optional<std::string>& new_error) const noexcept {
        return kind == RecordKind::Changed && previous_error && !new_error;
    }
};

/// Ordered results, at most one per distinct environment. Concurrent
/// record() calls on the same ledger are serialized internally.
class Ledger {
public:
    Ledger() = default;
    Ledger(const Ledger& other);
    Ledger& operator=(const Ledger& other);
    Ledger(Ledger&& other) noexcept;
    Ledger& operator=(Ledger&& other) noexcept;

    RecordOutcome record(const Environment& environment, std::optional<std::string> error);

    /// True iff at least one recorded environment passed.
    [[nodiscard]] bool any_passed() const;

    /// Result for \p environment, if one was recorded.
    [[nodiscard]] std::optional<Entry> find(const Environment& environment) const;

    /// Snapshot of all entries in recording order.
    [[nodiscard]] std::vector<Entry> entries() const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

} // namespace weave::check

#endif // WEAVE_CHECK_HPP
