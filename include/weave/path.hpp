/// \file path.hpp
/// \brief Hierarchical namespaced identifiers shared by native and surface items.
///
/// A path is a non-empty sequence of name segments. A single segment names a
/// built-in type with no owning package; longer paths start with the name of
/// the package that owns them, followed by module names and the entity's own
/// name.

#ifndef WEAVE_PATH_HPP
#define WEAVE_PATH_HPP

#include <weave/error.hpp>

#include <compare>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace weave::path {

class Path {
public:
    /// Build from segments. Fails if the list or any segment is empty.
    static Result<Path> from_segments(std::vector<std::string> segments);

    /// Parse a "::"-separated path such as "pkg::module::Item".
    static Result<Path> parse(std::string_view text);

    /// Single-segment path. Fails if \p name is empty.
    static Result<Path> builtin(std::string_view name);

    [[nodiscard]] const std::vector<std::string>& segments() const noexcept { return segments_; }
    [[nodiscard]] std::size_t size() const noexcept { return segments_.size(); }
    [[nodiscard]] const std::string& last() const noexcept { return segments_.back(); }

    /// Owning package, or nothing for a built-in (single-segment) path.
    [[nodiscard]] std::optional<std::string_view> package() const;

    /// Path without its last segment, or nothing for a single-segment path.
    [[nodiscard]] std::optional<Path> parent() const;

    /// Append one segment.
    [[nodiscard]] Result<Path> join(std::string_view segment) const;

    /// Copy with the last segment replaced.
    [[nodiscard]] Result<Path> with_last(std::string_view segment) const;

    /// True if \p other lies strictly below this path.
    [[nodiscard]] bool is_ancestor_of(const Path& other) const;

    /// True if \p other lies exactly one level below this path.
    [[nodiscard]] bool is_direct_parent_of(const Path& other) const;

    [[nodiscard]] bool is_child_of(const Path& parent) const { return parent.is_direct_parent_of(*this); }

    /// Render for use inside \p current_package. Paths of that package are
    /// rendered relative to its root ("crate::a::b"), foreign paths are fully
    /// qualified ("::other::a::b"), built-ins are bare.
    [[nodiscard]] std::string render(std::optional<std::string_view> current_package = std::nullopt) const;

    /// Plain "::"-joined form.
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const Path&, const Path&) = default;
    friend auto operator<=>(const Path&, const Path&) = default;

private:
    explicit Path(std::vector<std::string> segments) : segments_(std::move(segments)) {}

    std::vector<std::string> segments_;
};

/// Lowercase words joined by '_' ("QString" -> "q_string").
std::string snake_case(std::string_view text);

} // namespace weave::path

#endif // WEAVE_PATH_HPP
