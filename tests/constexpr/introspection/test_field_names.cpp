#include <RecordForge/struct_introspection.hpp>
#include <RecordForge/type_name.hpp>

#include <string>
#include <string_view>
#include <type_traits>

#include "../../test_model.hpp"

using namespace RecordForge;
using namespace RecordForge::options;

namespace field_names_model {

struct Vec {
    float x, y, z;
};

struct Renamed {
    int first;
    Annotated<int, key<"first">> second;
};

} // namespace field_names_model

using namespace field_names_model;

template<> struct RecordForge::AnnotatedField<Vec, 1> {
    using Options = OptionsPack<key<"vertical">>;
};

// ============================================================================
// Field counts and declared types
// ============================================================================

static_assert(introspection::structureElementsCount<TestModel::Person> == 3);
static_assert(introspection::structureElementsCount<TestModel::Order> == 8);
static_assert(introspection::structureElementsCount<TestModel::Empty> == 0);
static_assert(introspection::structureElementsCount<TestModel::Account> == 3);

static_assert(std::is_same_v<introspection::structureElementTypeByIndex<1, TestModel::Person>, int>);
static_assert(std::is_same_v<introspection::structureElementTypeByIndex<2, TestModel::Order>,
                             std::array<TestModel::OrderLine, 2>>);
static_assert(std::is_same_v<introspection::structureElementTypeByIndex<1, TestModel::Account>, std::int64_t>);
static_assert(std::is_same_v<introspection::structureElementTypeByIndex<0, TestModel::Annotations>,
                             Annotated<std::string, key<"display_name">>>);

// ============================================================================
// Names: declared, renamed with key<>, from StructMeta, from AnnotatedField
// ============================================================================

static_assert(introspection::fieldNames<TestModel::Person>[0] == "name");
static_assert(introspection::fieldNames<TestModel::Person>[1] == "age");
static_assert(introspection::fieldNames<TestModel::Person>[2] == "email");

static_assert(introspection::fieldName<TestModel::Annotations, 0>() == "display_name");
static_assert(introspection::fieldName<TestModel::Annotations, 1>() == "contact");
static_assert(introspection::fieldName<TestModel::Annotations, 3>() == "years");

static_assert(introspection::fieldName<TestModel::Account, 0>() == "owner");
static_assert(introspection::fieldName<TestModel::Account, 2>() == "billing");

static_assert(introspection::fieldName<Vec, 0>() == "x");
static_assert(introspection::fieldName<Vec, 1>() == "vertical");
static_assert(introspection::fieldName<Vec, 2>() == "z");

static_assert(introspection::fieldNamesAreUnique<TestModel::Order>());
static_assert(!introspection::fieldNamesAreUnique<Renamed>(), "key<> collides with a declared name");

// ============================================================================
// Options reach the field from every annotation site
// ============================================================================

static_assert(introspection::field_opts_getter<TestModel::Annotations, 1>::has_option<options::detail::email_tag>);
static_assert(!introspection::field_opts_getter<TestModel::Annotations, 0>::has_option<options::detail::email_tag>);
static_assert(introspection::field_opts_getter<TestModel::Account, 2>::has_option<options::detail::email_tag>);
static_assert(introspection::field_opts_getter<Vec, 1>::has_option<options::detail::key_tag>);
static_assert(!introspection::field_opts_getter<Vec, 0>::has_option<options::detail::key_tag>);

// ============================================================================
// Type and record names
// ============================================================================

static_assert(type_name<int> == "int");
static_assert(type_name<float*> == "float*" || type_name<float*> == "float *");
static_assert(type_name<TestModel::Person> == "TestModel::Person");
static_assert(record_name<TestModel::Person>() == "Person");
static_assert(record_name<TestModel::Order>() == "Order");
static_assert(record_name<TestModel::Account>() == "Account", "StructMeta<T>::Name");
