/// \file type_conversion_test.cpp
/// \brief Unit tests for weave::type — captions, unsafety, conversions.

#include <weave/weave.hpp>
#include "../test_harness.hpp"

#include <string>

namespace {

using weave::path::Path;
using weave::type::Conversion;
using weave::type::FinalType;
using weave::type::Type;

Path P(std::string_view text) {
    return *Path::parse(text);
}

Type named(std::string_view text) {
    return Type::named(P(text));
}

void test_shapes() {
    SECTION("Shapes and accessors");

    CHECK(Type().is_unit());
    CHECK(Type::unit().is_unit());
    CHECK(named("pkg::Item").is_named());
    CHECK(Type::function(Type::unit(), {}).is_function());

    auto ptr = Type::pointer(named("pkg::Item"), true);
    CHECK(ptr.is_indirection());
    CHECK(ptr.is_pointer());
    CHECK(!ptr.is_borrow());
    CHECK_VAL(ptr.pointee(), _v == named("pkg::Item"));
    CHECK_VAL(ptr.is_const_indirection(), _v == true);
    CHECK_ERR(named("pkg::Item").pointee(), weave::ErrorCategory::Validation);
    CHECK_ERR(named("pkg::Item").is_const_indirection(), weave::ErrorCategory::Validation);

    auto mut_ptr = ptr;
    CHECK_OK(mut_ptr.set_const(false));
    CHECK_VAL(mut_ptr.is_const_indirection(), _v == false);
    CHECK_VAL(ptr.is_const_indirection(), _v == true);  // copies are independent
    auto plain = named("pkg::Item");
    CHECK_ERR(plain.set_const(true), weave::ErrorCategory::Validation);

    CHECK_EQ(ptr.to_string(), std::string("*const pkg::Item"));
    CHECK_EQ(Type::borrow(named("i32"), false, "a").to_string(), std::string("&'a mut i32"));
}

void test_lifetimes() {
    SECTION("Lifetimes");

    auto ref = Type::borrow(named("pkg::Item"), true);
    CHECK(!ref.lifetime().has_value());
    auto with = ref.with_lifetime("a");
    CHECK(with.lifetime() == std::string_view("a"));
    CHECK(!ref.lifetime().has_value());

    // Raw pointers carry no lifetime.
    auto ptr = Type::pointer(named("pkg::Item"), true).with_lifetime("a");
    CHECK(!ptr.lifetime().has_value());
}

void test_equality() {
    SECTION("Structural equality");

    CHECK(Type::pointer(named("pkg::A"), true) == Type::pointer(named("pkg::A"), true));
    CHECK(Type::pointer(named("pkg::A"), true) != Type::pointer(named("pkg::A"), false));
    CHECK(Type::pointer(named("pkg::A"), true) != Type::borrow(named("pkg::A"), true));
    CHECK(Type::named(P("pkg::Vec"), {named("i32")}) != Type::named(P("pkg::Vec"), {named("u32")}));
    CHECK(Type::function(named("i32"), {named("u8")}) == Type::function(named("i32"), {named("u8")}));
}

void test_caption() {
    SECTION("Caption");

    auto context = P("pkg::widgets");

    CHECK_EQ(Type::unit().caption(context), std::string("unit"));
    CHECK_EQ(named("i32").caption(context), std::string("i32"));
    CHECK_EQ(named("std::os::raw::c_int").caption(context), std::string("c_int"));
    CHECK_EQ(named("std::ffi::CString").caption(context), std::string("c_string"));

    // Shared prefix with the context is dropped.
    CHECK_EQ(named("pkg::widgets::PushButton").caption(context), std::string("push_button"));
    CHECK_EQ(named("pkg::core::QString").caption(context), std::string("core_q_string"));
    CHECK_EQ(named("other::gui::Color").caption(context), std::string("other_gui_color"));

    // Repeated segment collapses.
    CHECK_EQ(named("other::color::Color").caption(context), std::string("other_color"));

    // Everything matched: bare last segment.
    CHECK_EQ(named("pkg::widgets").caption(context), std::string("widgets"));

    // Type arguments appended.
    auto list = Type::named(P("pkg::core::List"), {named("i32"), named("pkg::widgets::Label")});
    CHECK_EQ(list.caption(context), std::string("core_list_i32_label"));

    // Indirections.
    CHECK_EQ(Type::pointer(named("pkg::widgets::Label"), true).caption(context),
             std::string("label_const_ptr"));
    CHECK_EQ(Type::borrow(named("pkg::widgets::Label"), false).caption(context),
             std::string("label_ref"));
    CHECK_EQ(Type::pointer(Type::pointer(named("i8"), false), true).caption(context),
             std::string("i8_ptr_const_ptr"));

    CHECK_EQ(Type::function(named("i32"), {named("pkg::Item")}).caption(context), std::string("fn"));

    // Deterministic.
    CHECK_EQ(list.caption(context), list.caption(context));
    CHECK_EQ(named("pkg::core::QString").caption(P("pkg")), std::string("core_q_string"));
}

void test_unsafety() {
    SECTION("Unsafety propagation");

    CHECK(!Type::unit().is_unsafe());
    CHECK(!named("pkg::Item").is_unsafe());
    CHECK(Type::pointer(named("pkg::Item"), true).is_unsafe());
    CHECK(!Type::borrow(named("pkg::Item"), true).is_unsafe());
    CHECK(Type::borrow(Type::pointer(named("i8"), true), true).is_unsafe());
    CHECK(!Type::borrow(Type::borrow(named("i8"), true), true).is_unsafe());

    CHECK(Type::named(P("pkg::List"), {Type::pointer(named("i8"), false)}).is_unsafe());
    CHECK(!Type::named(P("pkg::List"), {named("i8")}).is_unsafe());

    CHECK(Type::function(Type::pointer(named("i8"), false), {}).is_unsafe());
    CHECK(Type::function(Type::unit(), {named("i32"), Type::pointer(named("i8"), true)}).is_unsafe());
    CHECK(!Type::function(Type::unit(), {named("i32"), Type::borrow(named("i8"), true)}).is_unsafe());

    auto nested = Type::named(P("pkg::Box"),
                              {Type::function(Type::unit(), {Type::pointer(named("u8"), true)})});
    CHECK(nested.is_unsafe());
}

void test_pointer_to_borrow() {
    SECTION("pointer_to_borrow");

    auto ffi = Type::pointer(named("pkg::Item"), false);
    FinalType t(ffi);
    CHECK(t.conversion() == Conversion::Identity);
    CHECK_EQ(t.surface_type(), t.ffi_type());

    CHECK_OK(t.pointer_to_borrow(true));
    CHECK(t.conversion() == Conversion::ReferenceFromPointer);
    CHECK(t.surface_type().is_borrow());
    CHECK(!t.surface_type().lifetime().has_value());
    CHECK_VAL(t.surface_type().is_const_indirection(), _v == true);
    CHECK_VAL(t.surface_type().pointee(), _v == named("pkg::Item"));
    CHECK_EQ(t.ffi_type(), ffi);

    // Second application fails and leaves the triple alone.
    auto before = t;
    CHECK_ERR(t.pointer_to_borrow(false), weave::ErrorCategory::ConversionError);
    CHECK_ERR(t.pointer_to_value(), weave::ErrorCategory::ConversionError);
    CHECK(t == before);
}

void test_pointer_to_value() {
    SECTION("pointer_to_value");

    auto ffi = Type::pointer(named("pkg::Point"), true);
    FinalType t(ffi);
    CHECK_OK(t.pointer_to_value());
    CHECK(t.conversion() == Conversion::ValueFromPointer);
    CHECK_EQ(t.surface_type(), named("pkg::Point"));
    CHECK_EQ(t.ffi_type(), ffi);

    auto before = t;
    CHECK_ERR(t.pointer_to_value(), weave::ErrorCategory::ConversionError);
    CHECK_ERR(t.pointer_to_borrow(true), weave::ErrorCategory::ConversionError);
    CHECK(t == before);
}

void test_conversion_shape_errors() {
    SECTION("Conversions on the wrong shape");

    FinalType value(named("pkg::Item"));
    auto before = value;
    CHECK_ERR(value.pointer_to_borrow(true), weave::ErrorCategory::ConversionError);
    CHECK_ERR(value.pointer_to_value(), weave::ErrorCategory::ConversionError);
    CHECK(value == before);

    // Borrow is not a raw pointer.
    FinalType borrowed(Type::borrow(named("pkg::Item"), true));
    CHECK_ERR(borrowed.pointer_to_borrow(true), weave::ErrorCategory::ConversionError);
    CHECK_ERR(borrowed.pointer_to_value(), weave::ErrorCategory::ConversionError);
    CHECK(borrowed.conversion() == Conversion::Identity);

    // Directly assigned descriptors are kept and block further conversion.
    FinalType flags(named("std::os::raw::c_uint"), named("pkg::Flags"), Conversion::IntegerFromFlags);
    CHECK(flags.conversion() == Conversion::IntegerFromFlags);
    CHECK_ERR(flags.pointer_to_value(), weave::ErrorCategory::ConversionError);

    FinalType owned(Type::pointer(named("pkg::Item"), false),
                    Type::named(P("pkg::CppBox"), {named("pkg::Item")}),
                    Conversion::OwningHandleFromPointer);
    CHECK_ERR(owned.pointer_to_borrow(false), weave::ErrorCategory::ConversionError);
    CHECK(owned.ffi_type().is_pointer());

    CHECK_EQ(weave::type::conversion_name(Conversion::SmartPointerFromPointer),
             std::string_view("smart_pointer_from_pointer"));
    CHECK_EQ(weave::type::conversion_name(Conversion::OptionalWrapperFromPointer),
             std::string_view("optional_wrapper_from_pointer"));
}

} // namespace

int main() {
    test_shapes();
    test_lifetimes();
    test_equality();
    test_caption();
    test_unsafety();
    test_pointer_to_borrow();
    test_pointer_to_value();
    test_conversion_shape_errors();
    return weave_test::report("weave type conversion tests");
}
