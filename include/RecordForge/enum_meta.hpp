#pragma once

#include <array>
#include <cstddef>
#include <type_traits>

namespace RecordForge {

template <auto... Values>
struct EnumVariants {};

template <class E>
struct EnumMeta {

};

namespace enum_detail {

template<class E, class V>
struct variants_of : std::false_type {};

template<class E, auto... Values>
struct variants_of<E, EnumVariants<Values...>>
    : std::bool_constant<(sizeof...(Values) > 0) && (std::is_same_v<decltype(Values), E> && ...)> {
    static constexpr std::array<E, sizeof...(Values)> values{Values...};
};

template<class E, class = void>
struct has_enum_meta : std::false_type {};

template<class E>
struct has_enum_meta<E, std::void_t<typename EnumMeta<E>::Variants>>
    : std::bool_constant<variants_of<E, typename EnumMeta<E>::Variants>::value> {};

} // namespace enum_detail


template<class E>
concept DescribedEnum = std::is_enum_v<E> && enum_detail::has_enum_meta<E>::value;

template<DescribedEnum E>
inline constexpr auto enumVariants = enum_detail::variants_of<E, typename EnumMeta<E>::Variants>::values;

template<DescribedEnum E>
constexpr E firstEnumVariant() {
    return enumVariants<E>[0];
}

} // namespace RecordForge
