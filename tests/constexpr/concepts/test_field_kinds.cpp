#include <RecordForge/static_schema.hpp>
#include <RecordForge/annotated.hpp>
#include <RecordForge/options.hpp>

#include <array>
#include <chrono>
#include <deque>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "../../test_model.hpp"

using namespace RecordForge;
using namespace RecordForge::options;
using static_schema::field_kind_v;

// ============================================================================
// Scalars
// ============================================================================

static_assert(field_kind_v<bool> == FieldKind::boolean);

static_assert(field_kind_v<int> == FieldKind::integer);
static_assert(field_kind_v<unsigned> == FieldKind::integer);
static_assert(field_kind_v<std::int8_t> == FieldKind::integer);
static_assert(field_kind_v<std::uint64_t> == FieldKind::integer);
static_assert(field_kind_v<long long> == FieldKind::integer);

static_assert(field_kind_v<float> == FieldKind::floating);
static_assert(field_kind_v<double> == FieldKind::floating);
static_assert(field_kind_v<long double> == FieldKind::floating);

// character types are not numbers
static_assert(field_kind_v<char> == FieldKind::unsupported);
static_assert(field_kind_v<char8_t> == FieldKind::unsupported);
static_assert(field_kind_v<wchar_t> == FieldKind::unsupported);

static_assert(field_kind_v<std::string> == FieldKind::string);
static_assert(field_kind_v<std::array<char, 16>> == FieldKind::string);
static_assert(field_kind_v<std::string_view> == FieldKind::unsupported, "views cannot own generated text");

static_assert(field_kind_v<TestModel::Status> == FieldKind::enumeration);
static_assert(field_kind_v<TestModel::Undescribed> == FieldKind::enumeration);

static_assert(field_kind_v<std::chrono::system_clock::time_point> == FieldKind::temporal);
static_assert(field_kind_v<std::chrono::steady_clock::time_point> == FieldKind::temporal);
static_assert(field_kind_v<std::chrono::sys_seconds> == FieldKind::temporal);

// ============================================================================
// Wrappers and containers
// ============================================================================

static_assert(field_kind_v<std::optional<int>> == FieldKind::optional);
static_assert(field_kind_v<std::optional<TestModel::Status>> == FieldKind::optional, "optional wins over enum");
static_assert(field_kind_v<std::optional<TestModel::Person>> == FieldKind::optional);
static_assert(field_kind_v<std::unique_ptr<TestModel::Person>> == FieldKind::optional);

static_assert(field_kind_v<std::vector<int>> == FieldKind::sequence);
static_assert(field_kind_v<std::list<std::string>> == FieldKind::sequence);
static_assert(field_kind_v<std::deque<TestModel::Person>> == FieldKind::sequence);
static_assert(field_kind_v<std::set<int>> == FieldKind::sequence);
static_assert(field_kind_v<std::unordered_set<std::string>> == FieldKind::sequence);

static_assert(field_kind_v<std::map<std::string, int>> == FieldKind::mapping);
static_assert(field_kind_v<std::unordered_map<int, TestModel::Person>> == FieldKind::mapping);

static_assert(field_kind_v<std::array<int, 3>> == FieldKind::fixed_array);
static_assert(field_kind_v<std::array<TestModel::OrderLine, 2>> == FieldKind::fixed_array);
static_assert(field_kind_v<std::array<std::array<int, 2>, 2>> == FieldKind::fixed_array);

// ============================================================================
// Records and the rest
// ============================================================================

static_assert(field_kind_v<TestModel::Person> == FieldKind::record);
static_assert(field_kind_v<TestModel::Order> == FieldKind::record);
static_assert(field_kind_v<TestModel::Empty> == FieldKind::record);
static_assert(field_kind_v<TestModel::Account> == FieldKind::record, "StructMeta-described class");

static_assert(field_kind_v<TestModel::Opaque> == FieldKind::opaque);
static_assert(field_kind_v<float*> == FieldKind::unsupported);
static_assert(field_kind_v<int TestModel::Person::*> == FieldKind::unsupported);

// ============================================================================
// Annotated fields are classified by their value type
// ============================================================================

static_assert(field_kind_v<Annotated<std::string, email>> == FieldKind::string);
static_assert(field_kind_v<Annotated<int, key<"years">>> == FieldKind::integer);
static_assert(field_kind_v<Annotated<std::optional<int>, key<"maybe">>> == FieldKind::optional);
static_assert(field_kind_v<Annotated<TestModel::Address>> == FieldKind::record);
static_assert(std::is_same_v<static_schema::AnnotatedValue<Annotated<std::string, email>>, std::string>);
// options come only from the Annotated<> arguments
static_assert(std::is_same_v<options::detail::annotation_meta_getter<Annotated<TestModel::Address>>::OptionsP, OptionsPack<>>);
static_assert(std::is_same_v<options::detail::annotation_meta_getter<Annotated<int, key<"years">>>::OptionsP, OptionsPack<key<"years">>>);

static_assert(static_schema::is_optional_field_v<std::optional<double>>);
static_assert(!static_schema::is_optional_field_v<std::vector<double>>);

// ============================================================================
// Kind names
// ============================================================================

static_assert(kind_to_string(FieldKind::fixed_array) == "fixed_array");
static_assert(kind_to_string(FieldKind::opaque) == "opaque");
static_assert(kind_to_string(FieldKind::unsupported) == "unsupported");
