/// \file type.cpp
/// \brief Implementation of weave::type — FFI type shapes and conversions.

#include <weave/core.hpp>
#include <weave/type.hpp>

#include <algorithm>
#include <type_traits>

namespace weave::type {

// ── Structural equality ─────────────────────────────────────────────────

namespace {

bool same_target(const std::shared_ptr<const Type>& a, const std::shared_ptr<const Type>& b) {
    if (a == b)
        return true;
    if (!a || !b)
        return false;
    return *a == *b;
}

const Type& unit_type() {
    static const Type unit;
    return unit;
}

const Type& deref(const std::shared_ptr<const Type>& target) {
    return target ? *target : unit_type();
}

} // anonymous namespace

bool operator==(const Named& a, const Named& b) {
    return a.path == b.path && a.arguments == b.arguments;
}

bool operator==(const FunctionSignature& a, const FunctionSignature& b) {
    return same_target(a.return_type, b.return_type) && a.parameters == b.parameters;
}

bool operator==(const Indirection& a, const Indirection& b) {
    return a.kind == b.kind && a.lifetime == b.lifetime && a.is_const == b.is_const
        && same_target(a.pointee, b.pointee);
}

// ── Factories ───────────────────────────────────────────────────────────

Type Type::named(path::Path path, std::vector<Type> arguments) {
    return Type(Named{std::move(path), std::move(arguments)});
}

Type Type::function(Type return_type, std::vector<Type> parameters) {
    return Type(FunctionSignature{std::make_shared<const Type>(std::move(return_type)),
                                  std::move(parameters)});
}

Type Type::pointer(Type pointee, bool is_const) {
    return Type(Indirection{IndirectionKind::Pointer, std::nullopt, is_const,
                            std::make_shared<const Type>(std::move(pointee))});
}

Type Type::borrow(Type pointee, bool is_const, std::optional<std::string> lifetime) {
    return Type(Indirection{IndirectionKind::Borrow, std::move(lifetime), is_const,
                            std::make_shared<const Type>(std::move(pointee))});
}

// ── Introspection ───────────────────────────────────────────────────────

bool Type::is_unit()        const { return std::holds_alternative<Unit>(shape_); }
bool Type::is_named()       const { return std::holds_alternative<Named>(shape_); }
bool Type::is_function()    const { return std::holds_alternative<FunctionSignature>(shape_); }
bool Type::is_indirection() const { return std::holds_alternative<Indirection>(shape_); }

bool Type::is_pointer() const {
    auto* ind = std::get_if<Indirection>(&shape_);
    return ind != nullptr && ind->kind == IndirectionKind::Pointer;
}

bool Type::is_borrow() const {
    auto* ind = std::get_if<Indirection>(&shape_);
    return ind != nullptr && ind->kind == IndirectionKind::Borrow;
}

Result<Named> Type::as_named() const {
    if (auto* named = std::get_if<Named>(&shape_))
        return *named;
    return std::unexpected(Error::validation("Expected a named type", to_string()));
}

Result<Indirection> Type::as_indirection() const {
    if (auto* ind = std::get_if<Indirection>(&shape_))
        return *ind;
    return std::unexpected(Error::validation("Expected a pointer-like type", to_string()));
}

Result<Type> Type::pointee() const {
    auto ind = as_indirection();
    if (!ind)
        return std::unexpected(ind.error());
    return deref(ind->pointee);
}

std::optional<std::string_view> Type::lifetime() const {
    auto* ind = std::get_if<Indirection>(&shape_);
    if (ind == nullptr || ind->kind != IndirectionKind::Borrow || !ind->lifetime)
        return std::nullopt;
    return std::string_view(*ind->lifetime);
}

Type Type::with_lifetime(std::string name) const {
    Type result = *this;
    if (auto* ind = std::get_if<Indirection>(&result.shape_)) {
        if (ind->kind == IndirectionKind::Borrow)
            ind->lifetime = std::move(name);
    }
    return result;
}

Result<bool> Type::is_const_indirection() const {
    auto ind = as_indirection();
    if (!ind)
        return std::unexpected(ind.error());
    return ind->is_const;
}

Status Type::set_const(bool value) {
    auto* ind = std::get_if<Indirection>(&shape_);
    if (ind == nullptr)
        return std::unexpected(Error::validation("Expected a pointer-like type", to_string()));
    ind->is_const = value;
    return weave::ok();
}

Result<Type> Type::pointer_to_borrow(bool is_const) const {
    auto* ind = std::get_if<Indirection>(&shape_);
    if (ind == nullptr)
        return std::unexpected(Error::conversion("Not a pointer-like type", to_string()));
    if (ind->kind != IndirectionKind::Pointer)
        return std::unexpected(Error::conversion("Not a raw pointer", to_string()));
    return Type(Indirection{IndirectionKind::Borrow, std::nullopt, is_const, ind->pointee});
}

// ── Caption ─────────────────────────────────────────────────────────────

namespace {

std::string caption_named(const Named& named, const path::Path& context) {
    const auto& parts = named.path.segments();
    if (parts.size() == 1)
        return path::snake_case(parts.front());
    if (named.path.package() == kStandardPackage)
        return path::snake_case(named.path.last());

    // Drop the leading segments shared with the context, then collapse
    // immediate repeats ("widgets::widget::Widget" -> "widget").
    const auto& context_parts = context.segments();
    std::size_t matched = 0;
    std::vector<std::string> kept;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (matched == i && matched < context_parts.size() && parts[i] == context_parts[matched]) {
            ++matched;
            continue;
        }
        auto snake = path::snake_case(parts[i]);
        if (kept.empty() || kept.back() != snake)
            kept.push_back(std::move(snake));
    }

    if (kept.empty())
        return named.path.last();

    std::string out;
    for (std::size_t i = 0; i < kept.size(); ++i) {
        if (i != 0)
            out += '_';
        out += kept[i];
    }
    return out;
}

} // anonymous namespace

std::string Type::caption(const path::Path& context) const {
    return std::visit([&](const auto& shape) -> std::string {
        using T = std::decay_t<decltype(shape)>;
        if constexpr (std::is_same_v<T, Unit>) {
            return "unit";
        } else if constexpr (std::is_same_v<T, Named>) {
            std::string name = caption_named(shape, context);
            if (!shape.arguments.empty()) {
                for (const auto& argument : shape.arguments)
                    name += "_" + argument.caption(context);
            }
            return name;
        } else if constexpr (std::is_same_v<T, FunctionSignature>) {
            return "fn";
        } else {
            static_assert(std::is_same_v<T, Indirection>);
            std::string name = deref(shape.pointee).caption(context);
            if (shape.is_const)
                name += "_const";
            name += shape.kind == IndirectionKind::Pointer ? "_ptr" : "_ref";
            return name;
        }
    }, shape_);
}

// ── Safety ──────────────────────────────────────────────────────────────

bool Type::is_unsafe() const {
    return std::visit([](const auto& shape) -> bool {
        using T = std::decay_t<decltype(shape)>;
        if constexpr (std::is_same_v<T, Unit>) {
            return false;
        } else if constexpr (std::is_same_v<T, Named>) {
            return std::any_of(shape.arguments.begin(), shape.arguments.end(),
                               [](const Type& t) { return t.is_unsafe(); });
        } else if constexpr (std::is_same_v<T, FunctionSignature>) {
            return deref(shape.return_type).is_unsafe()
                || std::any_of(shape.parameters.begin(), shape.parameters.end(),
                               [](const Type& t) { return t.is_unsafe(); });
        } else {
            static_assert(std::is_same_v<T, Indirection>);
            return shape.kind == IndirectionKind::Pointer || deref(shape.pointee).is_unsafe();
        }
    }, shape_);
}

// ── Text form ───────────────────────────────────────────────────────────

std::string Type::to_string() const {
    return std::visit([](const auto& shape) -> std::string {
        using T = std::decay_t<decltype(shape)>;
        if constexpr (std::is_same_v<T, Unit>) {
            return "()";
        } else if constexpr (std::is_same_v<T, Named>) {
            std::string out = shape.path.to_string();
            if (!shape.arguments.empty()) {
                out += '<';
                for (std::size_t i = 0; i < shape.arguments.size(); ++i) {
                    if (i != 0)
                        out += ", ";
                    out += shape.arguments[i].to_string();
                }
                out += '>';
            }
            return out;
        } else if constexpr (std::is_same_v<T, FunctionSignature>) {
            std::string out = "fn(";
            for (std::size_t i = 0; i < shape.parameters.size(); ++i) {
                if (i != 0)
                    out += ", ";
                out += shape.parameters[i].to_string();
            }
            return out + ") -> " + deref(shape.return_type).to_string();
        } else {
            static_assert(std::is_same_v<T, Indirection>);
            std::string out;
            if (shape.kind == IndirectionKind::Pointer) {
                out = shape.is_const ? "*const " : "*mut ";
            } else {
                out = "&";
                if (shape.lifetime)
                    out += "'" + *shape.lifetime + " ";
                if (!shape.is_const)
                    out += "mut ";
            }
            return out + deref(shape.pointee).to_string();
        }
    }, shape_);
}

// ── Conversions ─────────────────────────────────────────────────────────

std::string_view conversion_name(Conversion conversion) {
    switch (conversion) {
        case Conversion::Identity:                   return "identity";
        case Conversion::ReferenceFromPointer:       return "reference_from_pointer";
        case Conversion::OptionalWrapperFromPointer: return "optional_wrapper_from_pointer";
        case Conversion::ValueFromPointer:           return "value_from_pointer";
        case Conversion::OwningHandleFromPointer:    return "owning_handle_from_pointer";
        case Conversion::SmartPointerFromPointer:    return "smart_pointer_from_pointer";
        case Conversion::IntegerFromFlags:           return "integer_from_flags";
    }
    return "unknown";
}

Status FinalType::pointer_to_borrow(bool make_const) {
    if (conversion_ != Conversion::Identity)
        return std::unexpected(Error::conversion("Conversion already applied",
                                                 std::string(conversion_name(conversion_))));
    auto borrowed = surface_type_.pointer_to_borrow(make_const);
    if (!borrowed)
        return std::unexpected(borrowed.error());
    surface_type_ = std::move(*borrowed);
    conversion_ = Conversion::ReferenceFromPointer;
    return weave::ok();
}

Status FinalType::pointer_to_value() {
    if (conversion_ != Conversion::Identity)
        return std::unexpected(Error::conversion("Conversion already applied",
                                                 std::string(conversion_name(conversion_))));
    if (!surface_type_.is_pointer())
        return std::unexpected(Error::conversion("Not a raw pointer", surface_type_.to_string()));
    auto target = surface_type_.pointee();
    if (!target)
        return std::unexpected(diagnostics::enrich(target.error(), "pointer_to_value"));
    surface_type_ = std::move(*target);
    conversion_ = Conversion::ValueFromPointer;
    return weave::ok();
}

} // namespace weave::type
