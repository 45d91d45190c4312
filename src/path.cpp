/// \file path.cpp
/// \brief Implementation of weave::path.

#include <weave/core.hpp>
#include <weave/path.hpp>

#include <algorithm>
#include <cctype>

namespace weave::path {

namespace {

constexpr std::string_view kSeparator = "::";

std::string joined(const std::vector<std::string>& segments, std::size_t first) {
    std::string out;
    for (std::size_t i = first; i < segments.size(); ++i) {
        if (i != first)
            out += kSeparator;
        out += segments[i];
    }
    return out;
}

bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
bool is_lower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
bool is_alnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }

} // anonymous namespace

// ── Construction ────────────────────────────────────────────────────────

Result<Path> Path::from_segments(std::vector<std::string> segments) {
    if (segments.empty())
        return std::unexpected(Error::validation("Path must have at least one segment"));
    for (const auto& segment : segments) {
        if (segment.empty())
            return std::unexpected(Error::validation("Path segment must not be empty",
                                                     joined(segments, 0)));
    }
    return Path(std::move(segments));
}

Result<Path> Path::parse(std::string_view text) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (true) {
        auto pos = text.find(kSeparator, start);
        if (pos == std::string_view::npos) {
            segments.emplace_back(text.substr(start));
            break;
        }
        segments.emplace_back(text.substr(start, pos - start));
        start = pos + kSeparator.size();
    }
    auto path = from_segments(std::move(segments));
    if (!path)
        return std::unexpected(Error::validation(path.error().message, std::string(text)));
    return path;
}

Result<Path> Path::builtin(std::string_view name) {
    return from_segments({std::string(name)});
}

// ── Queries ─────────────────────────────────────────────────────────────

std::optional<std::string_view> Path::package() const {
    if (segments_.size() > 1)
        return std::string_view(segments_.front());
    return std::nullopt;
}

std::optional<Path> Path::parent() const {
    if (segments_.size() < 2)
        return std::nullopt;
    return Path(std::vector<std::string>(segments_.begin(), segments_.end() - 1));
}

Result<Path> Path::join(std::string_view segment) const {
    if (segment.empty())
        return std::unexpected(Error::validation("Path segment must not be empty", to_string()));
    auto segments = segments_;
    segments.emplace_back(segment);
    return Path(std::move(segments));
}

Result<Path> Path::with_last(std::string_view segment) const {
    if (segment.empty())
        return std::unexpected(Error::validation("Path segment must not be empty", to_string()));
    auto segments = segments_;
    segments.back() = std::string(segment);
    return Path(std::move(segments));
}

bool Path::is_ancestor_of(const Path& other) const {
    if (other.segments_.size() <= segments_.size())
        return false;
    return std::equal(segments_.begin(), segments_.end(), other.segments_.begin());
}

bool Path::is_direct_parent_of(const Path& other) const {
    return other.segments_.size() == segments_.size() + 1 && is_ancestor_of(other);
}

// ── Rendering ───────────────────────────────────────────────────────────

std::string Path::render(std::optional<std::string_view> current_package) const {
    auto own = package();
    if (current_package && own && *own == *current_package)
        return std::string(kPackageRootKeyword) + std::string(kSeparator) + joined(segments_, 1);

    if (segments_.size() == 1)
        return segments_.front();
    return std::string(kSeparator) + joined(segments_, 0);
}

std::string Path::to_string() const {
    return joined(segments_, 0);
}

// ── Name helpers ────────────────────────────────────────────────────────

std::string snake_case(std::string_view text) {
    std::vector<std::string> words;
    std::string current;

    auto flush = [&] {
        if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (!is_alnum(c)) {
            flush();
            continue;
        }
        if (is_upper(c) && !current.empty()) {
            char prev = text[i - 1];
            bool next_lower = i + 1 < text.size() && is_lower(text[i + 1]);
            // "fooBar", "v2Bar" and the last capital of "HTTPServer" start a word.
            if (is_lower(prev) || is_digit(prev) || (is_upper(prev) && next_lower))
                flush();
        }
        current += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    flush();

    std::string out;
    for (std::size_t i = 0; i < words.size(); ++i) {
        if (i != 0)
            out += '_';
        out += words[i];
    }
    return out;
}

} // namespace weave::path
