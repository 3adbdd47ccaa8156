#pragma once

#include <cstdint>
#include <string_view>

#include "static_schema.hpp"
#include "enum_meta.hpp"

namespace RecordForge {

enum class BuiltinRule : std::uint8_t {
    first_enum_variant,
    absent,
    empty_collection,
    element_wise,
    nested_record,
    synthesized_email,
    boolean_false,
    sequence_integer,
    sequence_floating,
    current_time,
    arbitrary_string,
    not_a_record,
    none
};

constexpr std::string_view rule_to_string(BuiltinRule r) {
    switch(r) {
    case BuiltinRule::first_enum_variant: return "first_enum_variant";
    case BuiltinRule::absent: return "absent";
    case BuiltinRule::empty_collection: return "empty_collection";
    case BuiltinRule::element_wise: return "element_wise";
    case BuiltinRule::nested_record: return "nested_record";
    case BuiltinRule::synthesized_email: return "synthesized_email";
    case BuiltinRule::boolean_false: return "boolean_false";
    case BuiltinRule::sequence_integer: return "sequence_integer";
    case BuiltinRule::sequence_floating: return "sequence_floating";
    case BuiltinRule::current_time: return "current_time";
    case BuiltinRule::arbitrary_string: return "arbitrary_string";
    case BuiltinRule::not_a_record: return "not_a_record";
    case BuiltinRule::none: return "none";
    }
    return "N/A";
}

namespace builtin_rules {

namespace detail {

constexpr char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? char(c - 'A' + 'a') : c;
}

constexpr bool mentions_email(std::string_view name) {
    constexpr std::string_view needle = "email";
    if(name.size() < needle.size()) return false;
    for(std::size_t i = 0; i + needle.size() <= name.size(); i ++) {
        bool match = true;
        for(std::size_t j = 0; j < needle.size(); j ++) {
            if(ascii_lower(name[i + j]) != needle[j]) {
                match = false;
                break;
            }
        }
        if(match) return true;
    }
    return false;
}

template<class Tp>
concept ClockWithNow = requires { Tp::clock::now(); };

} // namespace detail


template<class V, class Opts>
constexpr BuiltinRule resolve(std::string_view name) {
    using namespace static_schema;
    constexpr FieldKind kind = field_kind_v<V>;

    if constexpr (kind == FieldKind::enumeration) {
        if constexpr (DescribedEnum<V>) {
            return BuiltinRule::first_enum_variant;
        } else {
            return BuiltinRule::none;
        }
    } else if constexpr (kind == FieldKind::optional) {
        return BuiltinRule::absent;
    } else if constexpr (kind == FieldKind::sequence || kind == FieldKind::mapping) {
        return BuiltinRule::empty_collection;
    } else if constexpr (kind == FieldKind::fixed_array) {
        return BuiltinRule::element_wise;
    } else if constexpr (kind == FieldKind::record) {
        return BuiltinRule::nested_record;
    } else if constexpr (kind == FieldKind::string) {
        if(Opts::template has_option<options::detail::email_tag> || detail::mentions_email(name)) {
            return BuiltinRule::synthesized_email;
        }
        return BuiltinRule::arbitrary_string;
    } else if constexpr (kind == FieldKind::boolean) {
        return BuiltinRule::boolean_false;
    } else if constexpr (kind == FieldKind::integer) {
        return BuiltinRule::sequence_integer;
    } else if constexpr (kind == FieldKind::floating) {
        return BuiltinRule::sequence_floating;
    } else if constexpr (kind == FieldKind::temporal) {
        if constexpr (detail::ClockWithNow<V>) {
            return BuiltinRule::current_time;
        } else {
            return BuiltinRule::none;
        }
    } else if constexpr (kind == FieldKind::opaque) {
        return BuiltinRule::not_a_record;
    } else {
        return BuiltinRule::none;
    }
}

} // namespace builtin_rules


template<class F, class Opts = typename options::detail::annotation_meta_getter<F>::options>
constexpr BuiltinRule ResolveBuiltinRule(std::string_view name) {
    return builtin_rules::resolve<static_schema::AnnotatedValue<F>, Opts>(name);
}

} // namespace RecordForge
