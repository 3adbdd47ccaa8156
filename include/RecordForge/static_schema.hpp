#pragma once
#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "options.hpp"
#include "struct_introspection.hpp"
#include "enum_meta.hpp"

#ifndef RECORDFORGE_MAX_NESTING_DEPTH
#define RECORDFORGE_MAX_NESTING_DEPTH 64
#endif

namespace RecordForge {

enum class FieldKind : std::uint8_t {
    enumeration,
    optional,
    sequence,
    mapping,
    fixed_array,
    record,
    string,
    boolean,
    integer,
    floating,
    temporal,
    opaque,       // class type that is none of the above and not a record
    unsupported
};

constexpr std::string_view kind_to_string(FieldKind k) {
    switch(k) {
    case FieldKind::enumeration: return "enumeration";
    case FieldKind::optional: return "optional";
    case FieldKind::sequence: return "sequence";
    case FieldKind::mapping: return "mapping";
    case FieldKind::fixed_array: return "fixed_array";
    case FieldKind::record: return "record";
    case FieldKind::string: return "string";
    case FieldKind::boolean: return "boolean";
    case FieldKind::integer: return "integer";
    case FieldKind::floating: return "floating";
    case FieldKind::temporal: return "temporal";
    case FieldKind::opaque: return "opaque";
    case FieldKind::unsupported: return "unsupported";
    }
    return "N/A";
}

namespace static_schema {


namespace input_checks {

// Top-level forbidden shapes: no recursion, no PFR, no ranges.
template<class T>
struct is_directly_forbidden {
    using D = std::remove_cvref_t<T>;
    static constexpr bool value =
        std::is_void_v<D> ||
        std::is_pointer_v<D> ||
        std::is_member_pointer_v<D> ||
        std::is_null_pointer_v<D> ||
        std::is_function_v<D> ||
        std::is_array_v<D> ||
        std::is_reference_v<T>;
};

template<class T>
constexpr bool is_directly_forbidden_v =
    is_directly_forbidden<T>::value;

} // namespace input_checks


template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};


using options::detail::annotation_meta_getter;

template<class Field>
using AnnotatedValue = typename annotation_meta_getter<Field>::value_t;


template<class T>
struct static_string_traits {
    static constexpr bool is_static = false;
};

template<std::size_t N>
struct static_string_traits<std::array<char, N>> {
    static constexpr bool is_static = true;

    // reserve one byte for the terminator
    static constexpr std::size_t max_size() { return N ? N - 1 : 0; }
};

template<class T>
struct is_std_array : std::false_type {};

template<class T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {
    using element_type = T;
    static constexpr std::size_t size = N;
};

template<class T>
struct is_time_point : std::false_type {};

template<class Clock, class Duration>
struct is_time_point<std::chrono::time_point<Clock, Duration>> : std::true_type {};

template<class T>
struct is_char_string : std::false_type {};

template<class Traits, class Alloc>
struct is_char_string<std::basic_string<char, Traits, Alloc>> : std::true_type {};

template<class C>
struct is_character : std::bool_constant<
    std::is_same_v<C, char> || std::is_same_v<C, wchar_t> ||
    std::is_same_v<C, char8_t> || std::is_same_v<C, char16_t> || std::is_same_v<C, char32_t>> {};


/* ######## Scalar categories ######## */

template<class C>
concept GenBool = std::same_as<AnnotatedValue<C>, bool>;

template<class C>
concept GenInteger =
    !GenBool<C> &&
    std::is_integral_v<AnnotatedValue<C>> &&
    !is_character<AnnotatedValue<C>>::value;

template<class C>
concept GenFloating = std::is_floating_point_v<AnnotatedValue<C>>;

template<class C>
concept GenString =
    is_char_string<AnnotatedValue<C>>::value ||
    static_string_traits<AnnotatedValue<C>>::is_static;

// wstring, u8string, ...: no rule, and never a sequence of code units
template<class C>
concept GenForeignString =
    is_specialization_of<AnnotatedValue<C>, std::basic_string>::value && !GenString<C>;

template<class C>
concept GenEnum = std::is_enum_v<AnnotatedValue<C>>;

template<class C>
concept GenTemporal = is_time_point<AnnotatedValue<C>>::value;


/* ######## Wrappers and containers ######## */

template<class C>
concept GenNullable =
    is_specialization_of<AnnotatedValue<C>, std::optional>::value ||
    is_specialization_of<AnnotatedValue<C>, std::unique_ptr>::value;

template<class C>
concept GenFixedArray =
    is_std_array<AnnotatedValue<C>>::value && !GenString<C>;

template<class C>
concept GenMapping =
    !GenString<C> && !GenForeignString<C> &&
    std::default_initializable<AnnotatedValue<C>> &&
    requires(AnnotatedValue<C>& m) {
        typename AnnotatedValue<C>::key_type;
        typename AnnotatedValue<C>::mapped_type;
        m.begin();
        m.end();
        m.clear();
    };

template<class C>
concept GenSequence =
    !GenString<C> && !GenForeignString<C> && !GenMapping<C> && !GenFixedArray<C> &&
    std::default_initializable<AnnotatedValue<C>> &&
    std::ranges::range<AnnotatedValue<C>> &&
    requires(AnnotatedValue<C>& s) {
        typename AnnotatedValue<C>::value_type;
        s.clear();
    };


/* ######## Record detection ######## */

namespace detail {

template<class T>
struct always_false : std::false_type {};

template<class T, class Seq>
struct constructible_from_fields;

template<class T, std::size_t... I>
struct constructible_from_fields<T, std::index_sequence<I...>> {
    static constexpr bool value =
        requires { T{std::declval<introspection::structureElementTypeByIndex<I, T>>()...}; } ||
        std::is_constructible_v<T, introspection::structureElementTypeByIndex<I, T>...>;
};

// converts only to a proper base of Derived; not copyable, so std::any rejects it
template<class Derived>
struct any_base_of {
    any_base_of() = default;
    any_base_of(const any_base_of&) = delete;

    template<class U>
        requires (std::is_base_of_v<U, Derived> && !std::is_same_v<U, Derived>)
    operator U&&() const;
};

template<class T>
concept aggregate_with_base = requires { T{ any_base_of<T>{} }; };

template<class T>
struct is_record {
    static constexpr bool value = [] {
        if constexpr (!std::is_class_v<T> || std::is_union_v<T>) {
            return false;
        } else if constexpr (introspection::hasExplicitDescriptor<T>) {
            return constructible_from_fields<T,
                std::make_index_sequence<introspection::structureElementsCount<T>>>::value;
        } else if constexpr (GenString<T> || GenNullable<T> || GenMapping<T> || GenSequence<T>
                             || GenFixedArray<T> || GenTemporal<T>) {
            return false;
        } else if constexpr (!std::is_aggregate_v<T> || GenForeignString<T>) {
            return false;
        } else if constexpr (aggregate_with_base<T>) {
            // PFR cannot enumerate inherited fields
            return false;
        } else {
            // aggregate, non-string, non-container: PFR can enumerate its fields
            return true;
        }
    }();
};

} // namespace detail

template<class T>
concept RecordLike =
    !input_checks::is_directly_forbidden_v<T> &&
    std::same_as<T, std::remove_cv_t<T>> &&
    !is_specialization_of<T, Annotated>::value &&
    detail::is_record<T>::value;

template<class C>
concept GenRecord = RecordLike<AnnotatedValue<C>>;


/* ######## Classification ######## */

template<class C>
consteval FieldKind field_kind() {
    if constexpr (GenEnum<C>) {
        return FieldKind::enumeration;
    } else if constexpr (GenNullable<C>) {
        return FieldKind::optional;
    } else if constexpr (GenString<C>) {
        return FieldKind::string;
    } else if constexpr (GenMapping<C>) {
        return FieldKind::mapping;
    } else if constexpr (GenSequence<C>) {
        return FieldKind::sequence;
    } else if constexpr (GenFixedArray<C>) {
        return FieldKind::fixed_array;
    } else if constexpr (GenTemporal<C>) {
        return FieldKind::temporal;
    } else if constexpr (GenRecord<C>) {
        return FieldKind::record;
    } else if constexpr (GenBool<C>) {
        return FieldKind::boolean;
    } else if constexpr (GenInteger<C>) {
        return FieldKind::integer;
    } else if constexpr (GenFloating<C>) {
        return FieldKind::floating;
    } else if constexpr (std::is_class_v<AnnotatedValue<C>> && !GenForeignString<C> &&
                         !is_specialization_of<AnnotatedValue<C>, std::basic_string_view>::value) {
        return FieldKind::opaque;
    } else {
        return FieldKind::unsupported;
    }
}

template<class C>
inline constexpr FieldKind field_kind_v = field_kind<std::remove_cv_t<C>>();

template<class C>
inline constexpr bool is_optional_field_v = field_kind_v<C> == FieldKind::optional;


} // namespace static_schema


namespace schema_analysis {
using namespace static_schema;

// optional, sequence and mapping fields are generated empty and add no depth
template <class Type>
consteval std::size_t calc_generation_depth() {
    using T = AnnotatedValue<Type>;
    if constexpr (field_kind_v<T> == FieldKind::fixed_array) {
        return 1 + calc_generation_depth<typename is_std_array<T>::element_type>();
    } else if constexpr (field_kind_v<T> == FieldKind::record) {
        constexpr std::size_t n = introspection::structureElementsCount<T>;
        if constexpr (n == 0) {
            return 1;
        } else {
            return 1 + []<std::size_t... I>(std::index_sequence<I...>) {
                return std::max({calc_generation_depth<introspection::structureElementTypeByIndex<I, T>>()...});
            }(std::make_index_sequence<n>{});
        }
    } else {
        return 1;
    }
}

template <class T>
consteval bool within_nesting_limit() {
    return calc_generation_depth<T>() <= RECORDFORGE_MAX_NESTING_DEPTH;
}

} // namespace schema_analysis

} // namespace RecordForge
