/// \file store.hpp
/// \brief Versioned store of native, FFI, and surface items for one package.
///
/// The store is the only place where cross-stage consistency is enforced.
/// Each pipeline stage (parse, derive, check, generate) mutates it in turn;
/// every mutating call raises the modified flag that the persistence layer
/// consults before writing the store back.

#ifndef WEAVE_STORE_HPP
#define WEAVE_STORE_HPP

#include <weave/check.hpp>
#include <weave/error.hpp>
#include <weave/item.hpp>
#include <weave/path.hpp>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace weave::store {

/// Next identifier to hand out, per collection.
struct NextIds {
    std::uint32_t native{1};
    std::uint32_t ffi{1};
    std::uint32_t surface{1};
};

/// Everything that is persisted between runs.
struct Data {
    std::string                     package_name;
    std::string                     package_version;
    std::vector<item::NativeItem>   native_items;
    std::vector<item::FfiItem>      ffi_items;
    std::vector<item::SurfaceItem>  surface_items;
    std::vector<check::Environment> environments;
    NextIds                         next_id;
};

/// Insertions since the last drain.
struct Counters {
    std::uint32_t added{0};
    std::uint32_t ignored{0};
};

// ── Child iteration ─────────────────────────────────────────────────────

/// Forward iterator over surface items that are direct children of a path.
class SurfaceChildIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type        = item::SurfaceItem;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const item::SurfaceItem*;
    using reference         = const item::SurfaceItem&;

    SurfaceChildIterator() = default;
    SurfaceChildIterator(pointer current, pointer end, const path::Path* parent);

    reference operator*()  const noexcept { return *current_; }
    pointer   operator->() const noexcept { return current_; }
    SurfaceChildIterator& operator++();
    SurfaceChildIterator  operator++(int);

    friend bool operator==(const SurfaceChildIterator& a, const SurfaceChildIterator& b) noexcept {
        return a.current_ == b.current_;
    }

private:
    void skip_non_children();

    pointer           current_{nullptr};
    pointer           end_{nullptr};
    const path::Path* parent_{nullptr};
};

/// Restartable view; holds a copy of the parent path and borrows the store.
class SurfaceChildRange {
public:
    SurfaceChildRange(std::span<const item::SurfaceItem> items, path::Path parent);
    [[nodiscard]] SurfaceChildIterator begin() const;
    [[nodiscard]] SurfaceChildIterator end()   const;

private:
    std::span<const item::SurfaceItem> items_;
    path::Path                         parent_;
};

// ── Store ───────────────────────────────────────────────────────────────

class Store {
public:
    /// Empty store at the initial version. A new store counts as modified.
    explicit Store(std::string package_name);

    /// Restore persisted state. Fails if identifiers are out of order or not
    /// below their collection's next identifier.
    static Result<Store> from_data(Data data);

    [[nodiscard]] const Data& data() const noexcept { return data_; }

    [[nodiscard]] bool is_modified() const noexcept { return is_modified_; }
    void set_saved() noexcept { is_modified_ = false; }

    [[nodiscard]] const std::string& package_name()    const noexcept { return data_.package_name; }
    [[nodiscard]] const std::string& package_version() const noexcept { return data_.package_version; }
    void set_package_version(std::string version);

    // ── Native items ────────────────────────────────────────────────────

    /// Insert unless an identical declaration exists. Returns the new id, or
    /// nothing when the declaration was already present.
    std::optional<item::NativeId> add_native(std::optional<item::FfiId> origin,
                                             item::NativePayload payload);

    [[nodiscard]] std::span<const item::NativeItem> native_items() const noexcept { return data_.native_items; }
    [[nodiscard]] Result<const item::NativeItem*> native_item(item::NativeId id) const;
    Result<item::NativeItem*> native_item_mut(item::NativeId id);
    [[nodiscard]] const item::NativeItem* find_native(const path::Path& path) const;

    // ── FFI items ───────────────────────────────────────────────────────

    /// Insert unless an identical wrapper exists. Returns whether it was new.
    bool add_ffi(item::FfiPayload payload);

    [[nodiscard]] std::span<const item::FfiItem> ffi_items() const noexcept { return data_.ffi_items; }
    [[nodiscard]] Result<const item::FfiItem*> ffi_item(item::FfiId id) const;
    Result<item::FfiItem*> ffi_item_mut(item::FfiId id);

    /// Record a check result on one FFI item's ledger.
    Result<check::RecordOutcome> record_check(item::FfiId id,
                                              const check::Environment& environment,
                                              std::optional<std::string> error);

    /// FFI items that passed somewhere and have not been processed yet.
    [[nodiscard]] std::vector<item::FfiId> passing_ffi_items() const;

    /// Flag an FFI item as consumed by surface generation.
    Status mark_processed(item::FfiId id);

    // ── Surface items ───────────────────────────────────────────────────

    /// Validate placement and insert. Returns the new id, or nothing when an
    /// identical item was already present.
    Result<std::optional<item::SurfaceId>> add_surface(path::Path path,
                                                       item::SurfacePayload payload);

    [[nodiscard]] std::span<const item::SurfaceItem> surface_items() const noexcept { return data_.surface_items; }
    [[nodiscard]] Result<const item::SurfaceItem*> surface_item(item::SurfaceId id) const;
    Result<item::SurfaceItem*> surface_item_mut(item::SurfaceId id);
    [[nodiscard]] const item::SurfaceItem* find_surface(const path::Path& path) const;
    [[nodiscard]] SurfaceChildRange children_of(const path::Path& parent) const;

    /// \p desired if free, otherwise the first free variant with a numeric
    /// suffix on the last segment ("item_2", "item_3", ...).
    [[nodiscard]] path::Path make_unique_path(const path::Path& desired) const;

    // ── Environments ────────────────────────────────────────────────────

    /// Returns false if the environment was already registered.
    bool register_environment(check::Environment environment);
    [[nodiscard]] std::span<const check::Environment> environments() const noexcept { return data_.environments; }

    // ── Stage invalidation ──────────────────────────────────────────────

    void clear_native();
    /// Also drops native items synthesized for the removed FFI items.
    void clear_ffi();
    void clear_surface();
    void clear_all_checker_results();

    // ── Counters ────────────────────────────────────────────────────────

    /// Return and reset the insertion counters.
    Counters drain_counters() noexcept;

    /// Drain the counters and log them when anything happened.
    Counters report_counters();

private:
    explicit Store(Data data) : data_(std::move(data)) {}

    Status validate_surface(const path::Path& path, const item::SurfacePayload& payload) const;

    Data     data_;
    bool     is_modified_{false};
    Counters counters_;
};

} // namespace weave::store

#endif // WEAVE_STORE_HPP
