/// \file type.hpp
/// \brief Types crossing the FFI boundary and the conversions between the
///        FFI-facing and surface-facing representation of a value.

#ifndef WEAVE_TYPE_HPP
#define WEAVE_TYPE_HPP

#include <weave/error.hpp>
#include <weave/path.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace weave::type {

class Type;

// ── Type shapes ─────────────────────────────────────────────────────────

/// No value crosses the boundary (a native `void` return).
struct Unit {
    friend bool operator==(const Unit&, const Unit&) = default;
};

/// Enum, struct or numeric alias, optionally with type arguments.
struct Named {
    weave::path::Path path;
    std::vector<Type> arguments;

    friend bool operator==(const Named& a, const Named& b);
};

/// Function pointer signature.
struct FunctionSignature {
    std::shared_ptr<const Type> return_type;
    std::vector<Type>           parameters;

    friend bool operator==(const FunctionSignature& a, const FunctionSignature& b);
};

enum class IndirectionKind {
    Pointer,  ///< Raw pointer; unsafe to dereference.
    Borrow,   ///< Checked reference, optionally tied to a named lifetime.
};

struct Indirection {
    IndirectionKind             kind{IndirectionKind::Pointer};
    std::optional<std::string>  lifetime;  ///< Only meaningful for Borrow.
    bool                        is_const{false};
    std::shared_ptr<const Type> pointee;

    friend bool operator==(const Indirection& a, const Indirection& b);
};

// ── Type ────────────────────────────────────────────────────────────────

/// Immutable-by-default value type. Nested types are shared, never mutated
/// in place; every transformation returns a new Type.
class Type {
public:
    using Shape = std::variant<Unit, Named, FunctionSignature, Indirection>;

    Type() = default;
    Type(Shape shape) : shape_(std::move(shape)) {}

    static Type unit() { return Type(); }
    static Type named(path::Path path, std::vector<Type> arguments = {});
    static Type function(Type return_type, std::vector<Type> parameters);
    static Type pointer(Type pointee, bool is_const);
    static Type borrow(Type pointee, bool is_const,
                       std::optional<std::string> lifetime = std::nullopt);

    [[nodiscard]] const Shape& shape() const noexcept { return shape_; }

    [[nodiscard]] bool is_unit()        const;
    [[nodiscard]] bool is_named()       const;
    [[nodiscard]] bool is_function()    const;
    [[nodiscard]] bool is_indirection() const;
    [[nodiscard]] bool is_pointer()     const;
    [[nodiscard]] bool is_borrow()      const;

    [[nodiscard]] Result<Named> as_named() const;
    [[nodiscard]] Result<Indirection> as_indirection() const;

    /// Target of an Indirection.
    [[nodiscard]] Result<Type> pointee() const;

    /// Lifetime of a Borrow, if any.
    [[nodiscard]] std::optional<std::string_view> lifetime() const;

    /// Copy with \p name attached when this is a Borrow; otherwise a plain copy.
    [[nodiscard]] Type with_lifetime(std::string name) const;

    /// Constness of the outermost indirection.
    [[nodiscard]] Result<bool> is_const_indirection() const;
    Status set_const(bool value);

    /// Raw pointer turned into a Borrow (no lifetime) over the same pointee.
    [[nodiscard]] Result<Type> pointer_to_borrow(bool is_const) const;

    /// Identifier-safe label used to disambiguate synthesized names.
    /// Segments shared with \p context are dropped from named types.
    [[nodiscard]] std::string caption(const path::Path& context) const;

    /// True if the type is, or contains at any depth, a raw pointer.
    [[nodiscard]] bool is_unsafe() const;

    /// Human-readable form for diagnostics ("*const pkg::Item").
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const Type& a, const Type& b) { return a.shape_ == b.shape_; }

private:
    Shape shape_{Unit{}};
};

// ── Conversions ─────────────────────────────────────────────────────────

/// How the surface-facing type was derived from the FFI-facing type.
enum class Conversion {
    Identity,                   ///< Same type on both sides.
    ReferenceFromPointer,       ///< `&T` exposed for `*const T` / `*mut T`.
    OptionalWrapperFromPointer, ///< Nullable wrapper over a pointer.
    ValueFromPointer,           ///< `T` exposed for `*const T`.
    OwningHandleFromPointer,    ///< Owning box over a heap pointer.
    SmartPointerFromPointer,    ///< Foreign smart-pointer adapter.
    IntegerFromFlags,           ///< Bit-flag enumeration passed as an integer.
};

std::string_view conversion_name(Conversion conversion);

/// A type at every processing step: the FFI signature type, the type shown
/// to users of the binding, and the conversion linking them. The FFI type is
/// fixed at construction.
class FinalType {
public:
    FinalType() = default;
    explicit FinalType(Type ffi_type)
        : ffi_type_(ffi_type), surface_type_(std::move(ffi_type)) {}
    FinalType(Type ffi_type, Type surface_type, Conversion conversion)
        : ffi_type_(std::move(ffi_type)), surface_type_(std::move(surface_type)),
          conversion_(conversion) {}

    [[nodiscard]] const Type& ffi_type()     const noexcept { return ffi_type_; }
    [[nodiscard]] const Type& surface_type() const noexcept { return surface_type_; }
    [[nodiscard]] Conversion  conversion()   const noexcept { return conversion_; }

    /// Expose a raw pointer as a borrow. Fails, leaving this unchanged, if a
    /// conversion is already applied or the surface type is not a pointer.
    Status pointer_to_borrow(bool make_const);

    /// Expose a raw pointer's pointee by value. Same failure rules.
    Status pointer_to_value();

    friend bool operator==(const FinalType&, const FinalType&) = default;

private:
    Type       ffi_type_;
    Type       surface_type_;
    Conversion conversion_{Conversion::Identity};
};

} // namespace weave::type

#endif // WEAVE_TYPE_HPP
