/// \file item.hpp
/// \brief Native declarations, FFI wrappers, and surface items kept by the store.

#ifndef WEAVE_ITEM_HPP
#define WEAVE_ITEM_HPP

#include <weave/check.hpp>
#include <weave/error.hpp>
#include <weave/path.hpp>
#include <weave/type.hpp>

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace weave::item {

// ── Identifiers ─────────────────────────────────────────────────────────
// Each collection has its own identifier space. Identifiers are allocated
// in increasing order and never handed out twice.

struct NativeId {
    std::uint32_t value{0};
    friend auto operator<=>(const NativeId&, const NativeId&) = default;
};

struct FfiId {
    std::uint32_t value{0};
    friend auto operator<=>(const FfiId&, const FfiId&) = default;
};

struct SurfaceId {
    std::uint32_t value{0};
    friend auto operator<=>(const SurfaceId&, const SurfaceId&) = default;
};

std::string to_string(NativeId id);
std::string to_string(FfiId id);
std::string to_string(SurfaceId id);

// ── Native declarations ─────────────────────────────────────────────────

enum class Visibility {
    Public,
    Protected,
    Private,
};

struct Namespace {
    weave::path::Path path;
    friend bool operator==(const Namespace&, const Namespace&) = default;
};

enum class TypeKind {
    Class,
    Enum,
};

struct TypeDeclaration {
    weave::path::Path        path;
    TypeKind                 kind{TypeKind::Class};
    std::vector<std::string> template_parameters;
    friend bool operator==(const TypeDeclaration&, const TypeDeclaration&) = default;
};

struct EnumValue {
    weave::path::Path path;  ///< Enum path joined with the value's name.
    std::int64_t value{0};
    friend bool operator==(const EnumValue&, const EnumValue&) = default;
};

/// Native type spellings are kept verbatim; the parser owns their meaning.
struct Argument {
    std::string name;
    std::string type;
    bool        has_default_value{false};
    friend bool operator==(const Argument&, const Argument&) = default;
};

struct Function {
    weave::path::Path     path;
    std::string           return_type;
    std::vector<Argument> arguments;
    bool                  is_member{false};
    bool                  is_const{false};
    bool                  is_static{false};
    bool                  is_virtual{false};
    bool                  allows_variadic_arguments{false};
    friend bool operator==(const Function&, const Function&) = default;
};

struct ClassField {
    weave::path::Path path;  ///< Class path joined with the field name.
    std::string type;
    Visibility  visibility{Visibility::Public};
    bool        is_static{false};
    friend bool operator==(const ClassField&, const ClassField&) = default;
};

struct ClassBase {
    weave::path::Path derived_class;
    weave::path::Path base_class;
    Visibility visibility{Visibility::Public};
    bool       is_virtual{false};
    int        base_index{0};
    friend bool operator==(const ClassBase&, const ClassBase&) = default;
};

/// Argument types of a signal, for which slot wrappers are needed.
struct SignalArguments {
    std::vector<std::string> types;
    friend bool operator==(const SignalArguments&, const SignalArguments&) = default;
};

using NativePayload = std::variant<Namespace, TypeDeclaration, EnumValue, Function,
                                   ClassField, ClassBase, SignalArguments>;

struct NativeItem {
    NativeId             id;
    NativePayload        payload;
    std::optional<FfiId> origin;  ///< FFI item this declaration was synthesized for.

    /// Path the declaration is named by; SignalArguments has none.
    [[nodiscard]] const weave::path::Path* path() const;
    [[nodiscard]] std::string describe() const;
};

// ── FFI wrappers ────────────────────────────────────────────────────────

struct FfiArgument {
    std::string name;
    type::Type  type;
    friend bool operator==(const FfiArgument&, const FfiArgument&) = default;
};

/// Plain wrapper function: only its signature has to be declared.
struct WrapperFunction {
    weave::path::Path        path;
    std::optional<NativeId>  source;
    std::vector<FfiArgument> arguments;
    type::Type               return_type;
    friend bool operator==(const WrapperFunction&, const WrapperFunction&) = default;
};

/// Receiver object connecting a native signal to a callback. Its class body
/// has to be emitted as extra helper source.
struct SlotWrapper {
    weave::path::Path       class_path;
    std::vector<type::Type> signal_arguments;
    std::string             signal_signature;
    friend bool operator==(const SlotWrapper&, const SlotWrapper&) = default;
};

using FfiPayload = std::variant<WrapperFunction, SlotWrapper>;

struct FfiItem {
    FfiId        id;
    FfiPayload   payload;
    check::Ledger checks;
    bool         processed{false};  ///< Consumed by surface generation.

    [[nodiscard]] const weave::path::Path& path() const;
    [[nodiscard]] bool is_source_item() const;
    [[nodiscard]] std::string describe() const;
};

// ── Surface items ───────────────────────────────────────────────────────

/// The package itself; its path is the single package segment.
struct PackageRoot {
    friend bool operator==(const PackageRoot&, const PackageRoot&) = default;
};

struct Module {
    std::optional<NativeId> source;
    friend bool operator==(const Module&, const Module&) = default;
};

struct Struct {
    std::optional<NativeId> source;
    bool                    is_opaque{true};
    friend bool operator==(const Struct&, const Struct&) = default;
};

struct SurfaceEnumValue {
    std::int64_t value{0};
    friend bool operator==(const SurfaceEnumValue&, const SurfaceEnumValue&) = default;
};

struct SurfaceArgument {
    std::string     name;
    type::FinalType type;
    friend bool operator==(const SurfaceArgument&, const SurfaceArgument&) = default;
};

struct SurfaceFunction {
    std::optional<FfiId>         source;
    std::vector<SurfaceArgument> arguments;
    type::FinalType              return_type;

    /// Callers must uphold extra invariants when a raw pointer remains
    /// anywhere in the exposed signature.
    [[nodiscard]] bool is_unsafe() const;

    friend bool operator==(const SurfaceFunction&, const SurfaceFunction&) = default;
};

struct TypeAlias {
    type::Type target;
    friend bool operator==(const TypeAlias&, const TypeAlias&) = default;
};

using SurfacePayload = std::variant<PackageRoot, Module, Struct, SurfaceEnumValue,
                                    SurfaceFunction, TypeAlias>;

struct SurfaceItem {
    SurfaceId         id;
    weave::path::Path path;
    SurfacePayload    payload;

    [[nodiscard]] bool is_root() const noexcept {
        return std::holds_alternative<PackageRoot>(payload);
    }
    /// First segment of the path.
    [[nodiscard]] std::string_view package_name() const { return path.segments().front(); }
    [[nodiscard]] bool is_child_of(const weave::path::Path& parent) const { return path.is_child_of(parent); }
    [[nodiscard]] std::string describe() const;
};

} // namespace weave::item

#endif // WEAVE_ITEM_HPP
