/// \file store.cpp
/// \brief Implementation of weave::store — item bookkeeping and validation.

#include <weave/core.hpp>
#include <weave/diagnostics.hpp>
#include <weave/store.hpp>

#include <algorithm>

namespace weave::store {

using diagnostics::LogLevel;

namespace {

/// Binary search by identifier; collections are kept in identifier order.
template <typename Items, typename Id>
auto find_by_id(Items& items, Id id) -> decltype(items.data()) {
    auto it = std::lower_bound(items.begin(), items.end(), id,
                               [](const auto& item, Id key) { return item.id < key; });
    if (it == items.end() || it->id != id)
        return nullptr;
    return &*it;
}

/// Identifiers strictly increasing and below \p next.
template <typename Item>
Status check_id_order(const std::vector<Item>& items, std::uint32_t next, std::string_view what) {
    std::uint32_t previous = 0;
    for (const auto& item : items) {
        if (item.id.value <= previous || item.id.value >= next)
            return std::unexpected(Error::validation("Identifiers out of order",
                                                     std::string(what) + " #"
                                                     + std::to_string(item.id.value)));
        previous = item.id.value;
    }
    return weave::ok();
}

} // anonymous namespace

// ── SurfaceChildIterator / Range ────────────────────────────────────────

SurfaceChildIterator::SurfaceChildIterator(pointer current, pointer end, const path::Path* parent)
    : current_(current), end_(end), parent_(parent) {
    skip_non_children();
}

void SurfaceChildIterator::skip_non_children() {
    while (current_ != end_ && !current_->is_child_of(*parent_))
        ++current_;
}

SurfaceChildIterator& SurfaceChildIterator::operator++() {
    if (current_ != end_) {
        ++current_;
        skip_non_children();
    }
    return *this;
}

SurfaceChildIterator SurfaceChildIterator::operator++(int) {
    SurfaceChildIterator tmp = *this;
    ++(*this);
    return tmp;
}

SurfaceChildRange::SurfaceChildRange(std::span<const item::SurfaceItem> items, path::Path parent)
    : items_(items), parent_(std::move(parent)) {}

SurfaceChildIterator SurfaceChildRange::begin() const {
    return SurfaceChildIterator(items_.data(), items_.data() + items_.size(), &parent_);
}

SurfaceChildIterator SurfaceChildRange::end() const {
    auto* last = items_.data() + items_.size();
    return SurfaceChildIterator(last, last, &parent_);
}

// ── Construction ────────────────────────────────────────────────────────

Store::Store(std::string package_name) : is_modified_(true) {
    data_.package_name = std::move(package_name);
    data_.package_version = std::string(kInitialPackageVersion);
}

Result<Store> Store::from_data(Data data) {
    if (data.package_name.empty())
        return std::unexpected(Error::validation("Package name must not be empty"));
    if (auto st = check_id_order(data.native_items, data.next_id.native, "native item"); !st)
        return std::unexpected(st.error());
    if (auto st = check_id_order(data.ffi_items, data.next_id.ffi, "ffi item"); !st)
        return std::unexpected(st.error());
    if (auto st = check_id_order(data.surface_items, data.next_id.surface, "surface item"); !st)
        return std::unexpected(st.error());
    return Store(std::move(data));
}

void Store::set_package_version(std::string version) {
    if (data_.package_version != version) {
        data_.package_version = std::move(version);
        is_modified_ = true;
    }
}

// ── Native items ────────────────────────────────────────────────────────

std::optional<item::NativeId> Store::add_native(std::optional<item::FfiId> origin,
                                                item::NativePayload payload) {
    auto same = std::find_if(data_.native_items.begin(), data_.native_items.end(),
                             [&](const item::NativeItem& i) { return i.payload == payload; });
    if (same != data_.native_items.end()) {
        ++counters_.ignored;
        diagnostics::log(LogLevel::Trace, "store", "native item already present: " + same->describe());
        return std::nullopt;
    }

    item::NativeId id{data_.next_id.native++};
    data_.native_items.push_back(item::NativeItem{id, std::move(payload), origin});
    ++counters_.added;
    is_modified_ = true;
    diagnostics::log(LogLevel::Debug, "store", "added " + data_.native_items.back().describe());
    return id;
}

Result<const item::NativeItem*> Store::native_item(item::NativeId id) const {
    if (auto* found = find_by_id(data_.native_items, id))
        return found;
    return std::unexpected(Error::not_found("Invalid native item id", item::to_string(id)));
}

Result<item::NativeItem*> Store::native_item_mut(item::NativeId id) {
    auto* found = find_by_id(data_.native_items, id);
    if (found == nullptr)
        return std::unexpected(Error::not_found("Invalid native item id", item::to_string(id)));
    is_modified_ = true;
    return found;
}

const item::NativeItem* Store::find_native(const path::Path& path) const {
    for (const auto& item : data_.native_items) {
        if (const auto* p = item.path(); p != nullptr && *p == path)
            return &item;
    }
    return nullptr;
}

// ── FFI items ───────────────────────────────────────────────────────────

bool Store::add_ffi(item::FfiPayload payload) {
    auto same = std::find_if(data_.ffi_items.begin(), data_.ffi_items.end(),
                             [&](const item::FfiItem& i) { return i.payload == payload; });
    if (same != data_.ffi_items.end()) {
        ++counters_.ignored;
        diagnostics::log(LogLevel::Trace, "store", "ffi item already present: " + same->describe());
        return false;
    }

    item::FfiId id{data_.next_id.ffi++};
    data_.ffi_items.push_back(item::FfiItem{id, std::move(payload), {}, false});
    ++counters_.added;
    is_modified_ = true;
    diagnostics::log(LogLevel::Debug, "store", "added " + data_.ffi_items.back().describe());
    return true;
}

Result<const item::FfiItem*> Store::ffi_item(item::FfiId id) const {
    if (auto* found = find_by_id(data_.ffi_items, id))
        return found;
    return std::unexpected(Error::not_found("Invalid ffi item id", item::to_string(id)));
}

Result<item::FfiItem*> Store::ffi_item_mut(item::FfiId id) {
    auto* found = find_by_id(data_.ffi_items, id);
    if (found == nullptr)
        return std::unexpected(Error::not_found("Invalid ffi item id", item::to_string(id)));
    is_modified_ = true;
    return found;
}

Result<check::RecordOutcome> Store::record_check(item::FfiId id,
                                                 const check::Environment& environment,
                                                 std::optional<std::string> error) {
    auto* found = find_by_id(data_.ffi_items, id);
    if (found == nullptr)
        return std::unexpected(Error::not_found("Invalid ffi item id", item::to_string(id)));
    auto outcome = found->checks.record(environment, std::move(error));
    if (outcome.kind != check::RecordKind::Unchanged)
        is_modified_ = true;
    return outcome;
}

std::vector<item::FfiId> Store::passing_ffi_items() const {
    std::vector<item::FfiId> ids;
    for (const auto& item : data_.ffi_items) {
        if (!item.processed && item.checks.any_passed())
            ids.push_back(item.id);
    }
    return ids;
}

Status Store::mark_processed(item::FfiId id) {
    auto* found = find_by_id(data_.ffi_items, id);
    if (found == nullptr)
        return std::unexpected(Error::not_found("Invalid ffi item id", item::to_string(id)));
    if (!found->processed) {
        found->processed = true;
        is_modified_ = true;
    }
    return weave::ok();
}

// ── Surface items ───────────────────────────────────────────────────────

Status Store::validate_surface(const path::Path& path, const item::SurfacePayload& payload) const {
    const std::string& package = path.segments().front();
    if (package != data_.package_name)
        return std::unexpected(Error::package_mismatch(
            "Item belongs to package '" + package + "', store holds '" + data_.package_name + "'",
            path.to_string()));

    if (std::holds_alternative<item::PackageRoot>(payload)) {
        if (path.size() != 1)
            return std::unexpected(Error::path("Package root must not have a parent", path.to_string()));
        return weave::ok();
    }

    auto ancestor = path.parent();
    if (!ancestor)
        return std::unexpected(Error::path("Only the package root may sit at the top level",
                                           path.to_string()));
    while (ancestor) {
        if (find_surface(*ancestor) == nullptr)
            return std::unexpected(Error::path("Unreachable ancestor " + ancestor->to_string(),
                                               path.to_string()));
        ancestor = ancestor->parent();
    }
    return weave::ok();
}

Result<std::optional<item::SurfaceId>> Store::add_surface(path::Path path,
                                                          item::SurfacePayload payload) {
    if (auto st = validate_surface(path, payload); !st) {
        diagnostics::log_error(LogLevel::Warning, "store", st.error());
        return std::unexpected(st.error());
    }

    auto same = std::find_if(data_.surface_items.begin(), data_.surface_items.end(),
                             [&](const item::SurfaceItem& i) {
                                 return i.path == path && i.payload == payload;
                             });
    if (same != data_.surface_items.end()) {
        ++counters_.ignored;
        diagnostics::log(LogLevel::Trace, "store", "surface item already present: " + same->describe());
        return std::optional<item::SurfaceId>{};
    }

    item::SurfaceId id{data_.next_id.surface++};
    data_.surface_items.push_back(item::SurfaceItem{id, std::move(path), std::move(payload)});
    ++counters_.added;
    is_modified_ = true;
    diagnostics::log(LogLevel::Debug, "store", "added " + data_.surface_items.back().describe());
    return std::optional<item::SurfaceId>{id};
}

Result<const item::SurfaceItem*> Store::surface_item(item::SurfaceId id) const {
    if (auto* found = find_by_id(data_.surface_items, id))
        return found;
    return std::unexpected(Error::not_found("Invalid surface item id", item::to_string(id)));
}

Result<item::SurfaceItem*> Store::surface_item_mut(item::SurfaceId id) {
    auto* found = find_by_id(data_.surface_items, id);
    if (found == nullptr)
        return std::unexpected(Error::not_found("Invalid surface item id", item::to_string(id)));
    is_modified_ = true;
    return found;
}

const item::SurfaceItem* Store::find_surface(const path::Path& path) const {
    for (const auto& item : data_.surface_items) {
        if (item.path == path)
            return &item;
    }
    return nullptr;
}

SurfaceChildRange Store::children_of(const path::Path& parent) const {
    return SurfaceChildRange(data_.surface_items, parent);
}

path::Path Store::make_unique_path(const path::Path& desired) const {
    if (find_surface(desired) == nullptr)
        return desired;

    // The suffix always starts with '_' so that a base ending in a digit
    // never runs into the counter ("vec2" -> "vec2_2").
    const std::string& base = desired.last();
    for (std::uint64_t number = 2;; ++number) {
        auto candidate = desired.with_last(base + "_" + std::to_string(number));
        if (candidate && find_surface(*candidate) == nullptr)
            return std::move(*candidate);
    }
}

// ── Environments ────────────────────────────────────────────────────────

bool Store::register_environment(check::Environment environment) {
    if (std::find(data_.environments.begin(), data_.environments.end(), environment)
        != data_.environments.end())
        return false;
    diagnostics::log(LogLevel::Debug, "store", "registered environment " + environment.to_string());
    data_.environments.push_back(std::move(environment));
    is_modified_ = true;
    return true;
}

// ── Stage invalidation ──────────────────────────────────────────────────

void Store::clear_native() {
    data_.native_items.clear();
    is_modified_ = true;
}

void Store::clear_ffi() {
    data_.ffi_items.clear();
    std::erase_if(data_.native_items,
                  [](const item::NativeItem& item) { return item.origin.has_value(); });
    is_modified_ = true;
}

void Store::clear_surface() {
    data_.surface_items.clear();
    is_modified_ = true;
}

void Store::clear_all_checker_results() {
    for (auto& item : data_.ffi_items)
        item.checks.clear();
    is_modified_ = true;
}

// ── Counters ────────────────────────────────────────────────────────────

Counters Store::drain_counters() noexcept {
    Counters drained = counters_;
    counters_ = {};
    return drained;
}

Counters Store::report_counters() {
    Counters drained = drain_counters();
    if (drained.added == 0 && drained.ignored == 0)
        return drained;

    std::string line = "Items added: " + std::to_string(drained.added);
    if (drained.ignored != 0)
        line += ", ignored: " + std::to_string(drained.ignored);
    diagnostics::log(LogLevel::Info, "store", line);
    return drained;
}

} // namespace weave::store
