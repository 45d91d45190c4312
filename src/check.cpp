/// \file check.cpp
/// \brief Implementation of weave::check — environments and result ledgers.

#include <weave/check.hpp>

#include <algorithm>

namespace weave::check {

// ── Target / Environment ────────────────────────────────────────────────

Target Target::host() {
    Target target;
#if defined(__x86_64__) || defined(_M_X64)
    target.arch = "x86_64";
#elif defined(__aarch64__) || defined(_M_ARM64)
    target.arch = "aarch64";
#elif defined(__i386__) || defined(_M_IX86)
    target.arch = "x86";
#elif defined(__arm__)
    target.arch = "arm";
#else
    target.arch = "unknown";
#endif

#if defined(__linux__)
    target.os = "linux";
#elif defined(__APPLE__)
    target.os = "macos";
#elif defined(_WIN32)
    target.os = "windows";
#else
    target.os = "unknown";
#endif

#if defined(_MSC_VER)
    target.env = "msvc";
#elif defined(__GLIBC__)
    target.env = "gnu";
#endif

    target.pointer_width = static_cast<std::uint32_t>(sizeof(void*) * 8);
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    target.endian = Endian::Big;
#else
    target.endian = Endian::Little;
#endif
    return target;
}

std::string Target::to_string() const {
    std::string out = arch + "-" + os;
    if (!env.empty())
        out += "-" + env;
    return out;
}

std::string Environment::to_string() const {
    std::string out = target.to_string();
    if (library_version)
        out += " (library " + *library_version + ")";
    return out;
}

// ── Ledger lifecycle ────────────────────────────────────────────────────
// The mutex is per object and never copied; only the entries travel.

Ledger::Ledger(const Ledger& other) : entries_(other.entries()) {}

Ledger& Ledger::operator=(const Ledger& other) {
    if (this != &other) {
        auto copied = other.entries();
        std::lock_guard<std::mutex> lock(mutex_);
        entries_ = std::move(copied);
    }
    return *this;
}

Ledger::Ledger(Ledger&& other) noexcept {
    std::lock_guard<std::mutex> lock(other.mutex_);
    entries_ = std::move(other.entries_);
}

Ledger& Ledger::operator=(Ledger&& other) noexcept {
    if (this != &other) {
        std::scoped_lock lock(mutex_, other.mutex_);
        entries_ = std::move(other.entries_);
    }
    return *this;
}

// ── Recording ───────────────────────────────────────────────────────────

RecordOutcome Ledger::record(const Environment& environment, std::optional<std::string> error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.environment == environment; });
    if (it == entries_.end()) {
        entries_.push_back(Entry{environment, std::move(error)});
        return {RecordKind::Added, std::nullopt};
    }
    if (it->error == error)
        return {RecordKind::Unchanged, std::nullopt};

    RecordOutcome outcome{RecordKind::Changed, std::move(it->error)};
    it->error = std::move(error);
    return outcome;
}

bool Ledger::any_passed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(),
                       [](const Entry& e) { return e.passed(); });
}

std::optional<Entry> Ledger::find(const Environment& environment) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        if (entry.environment == environment)
            return entry;
    }
    return std::nullopt;
}

std::vector<Entry> Ledger::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::size_t Ledger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool Ledger::empty() const {
    return size() == 0;
}

void Ledger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace weave::check
