/// \file item.cpp
/// \brief Item accessors and descriptions.

#include <weave/item.hpp>

#include <algorithm>
#include <type_traits>

namespace weave::item {

std::string to_string(NativeId id)  { return "native#" + std::to_string(id.value); }
std::string to_string(FfiId id)     { return "ffi#" + std::to_string(id.value); }
std::string to_string(SurfaceId id) { return "surface#" + std::to_string(id.value); }

// ── Native ──────────────────────────────────────────────────────────────

const weave::path::Path* NativeItem::path() const {
    return std::visit([](const auto& p) -> const weave::path::Path* {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ClassBase>)
            return &p.derived_class;
        else if constexpr (std::is_same_v<T, SignalArguments>)
            return nullptr;
        else
            return &p.path;
    }, payload);
}

std::string NativeItem::describe() const {
    std::string body = std::visit([](const auto& p) -> std::string {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, Namespace>) {
            return "namespace " + p.path.to_string();
        } else if constexpr (std::is_same_v<T, TypeDeclaration>) {
            return (p.kind == TypeKind::Enum ? "enum " : "class ") + p.path.to_string();
        } else if constexpr (std::is_same_v<T, EnumValue>) {
            return "enum value " + p.path.to_string() + " = " + std::to_string(p.value);
        } else if constexpr (std::is_same_v<T, Function>) {
            std::string out = p.return_type + " " + p.path.to_string() + "(";
            for (std::size_t i = 0; i < p.arguments.size(); ++i) {
                if (i != 0)
                    out += ", ";
                out += p.arguments[i].type;
            }
            out += ")";
            if (p.is_const)
                out += " const";
            return out;
        } else if constexpr (std::is_same_v<T, ClassField>) {
            return "field " + p.path.to_string() + ": " + p.type;
        } else if constexpr (std::is_same_v<T, ClassBase>) {
            return "base " + p.base_class.to_string() + " of " + p.derived_class.to_string();
        } else {
            static_assert(std::is_same_v<T, SignalArguments>);
            std::string out = "signal arguments (";
            for (std::size_t i = 0; i < p.types.size(); ++i) {
                if (i != 0)
                    out += ", ";
                out += p.types[i];
            }
            return out + ")";
        }
    }, payload);
    return to_string(id) + " " + body;
}

// ── FFI ─────────────────────────────────────────────────────────────────

const weave::path::Path& FfiItem::path() const {
    return std::visit([](const auto& p) -> const weave::path::Path& {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, WrapperFunction>)
            return p.path;
        else
            return p.class_path;
    }, payload);
}

bool FfiItem::is_source_item() const {
    return std::holds_alternative<SlotWrapper>(payload);
}

std::string FfiItem::describe() const {
    std::string out = to_string(id) + (is_source_item() ? " slot wrapper " : " wrapper ")
                    + path().to_string();
    if (auto* function = std::get_if<WrapperFunction>(&payload)) {
        out += "(";
        for (std::size_t i = 0; i < function->arguments.size(); ++i) {
            if (i != 0)
                out += ", ";
            out += function->arguments[i].type.to_string();
        }
        out += ") -> " + function->return_type.to_string();
    }
    return out;
}

// ── Surface ─────────────────────────────────────────────────────────────

bool SurfaceFunction::is_unsafe() const {
    if (return_type.surface_type().is_unsafe())
        return true;
    return std::any_of(arguments.begin(), arguments.end(), [](const SurfaceArgument& a) {
        return a.type.surface_type().is_unsafe();
    });
}

std::string SurfaceItem::describe() const {
    std::string_view kind = std::visit([](const auto& p) -> std::string_view {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, PackageRoot>)           return "package";
        else if constexpr (std::is_same_v<T, Module>)           return "module";
        else if constexpr (std::is_same_v<T, Struct>)           return "struct";
        else if constexpr (std::is_same_v<T, SurfaceEnumValue>) return "enum value";
        else if constexpr (std::is_same_v<T, SurfaceFunction>)  return "function";
        else {
            static_assert(std::is_same_v<T, TypeAlias>);
            return "type alias";
        }
    }, payload);
    return to_string(id) + " " + std::string(kind) + " " + path.to_string();
}

} // namespace weave::item
