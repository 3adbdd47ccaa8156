#pragma once

#include <array>
#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

#include "options.hpp"

namespace RecordForge {

// the listed order must match a constructor of the type
template <class T>
struct StructMeta {

};

template <auto MPtr, ConstString key, class ... Opts>
struct Field;

template <typename C, typename T, T C::*MPtr, ConstString key, class ... Opts>
struct Field<MPtr, key, Opts...>{
    using ClassT = C;
    using ValueT = T;
    using OptionsP = OptionsPack<Opts...>;
    static constexpr auto Name  = key;
    static constexpr  T C::* MemberP = MPtr;
};

template <class ... F>
struct StructFields{
    using FieldsTuple = std::tuple<F...>;
};


namespace introspection {

namespace detail {


template<class T>
struct IntrospectionImpl {
    using StructT = std::remove_cv_t<T>;

    template<std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(StructT & s) {
        return (pfr::get<Index>(s));
    }

    template<std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(const StructT & s) {
        return (pfr::get<Index>(s));
    }

    static constexpr std::size_t structureElementsCount = pfr::tuple_size_v<StructT>;

    template<std::size_t Index>
    using structureElementTypeByIndex = pfr::tuple_element_t<Index, StructT>;

    template<std::size_t Index>
    static constexpr std::string_view structureElementNameByIndex = pfr::get_name<Index, StructT>();

    template<std::size_t Index>
    using ExternalOptions = OptionsPack<>;
};

template<class T>
struct is_fields_pack : std::false_type {};

template<class... F>
struct is_fields_pack<StructFields<F...>> : std::true_type {};


template<class T, class = void>
struct has_struct_meta_specialization_impl : std::false_type {};

template<class T>
struct has_struct_meta_specialization_impl<T, std::void_t<typename StructMeta<T>::Fields>>
    : std::bool_constant<is_fields_pack<typename StructMeta<T>::Fields>::value> {};

template<class T>
inline constexpr bool has_struct_meta_specialization =
    has_struct_meta_specialization_impl<T>::value;


template <class T>
    requires (has_struct_meta_specialization<T>)
struct IntrospectionImpl<T> {
    using Fields = typename StructMeta<T>::Fields::FieldsTuple;

    static constexpr std::size_t structureElementsCount = std::tuple_size_v<Fields>;

    template<std::size_t Index, class StructT>
    static constexpr decltype(auto) getStructElementByIndex(StructT & s) {
        using F = std::tuple_element_t<Index, Fields>;
        return (s.*(F::MemberP));
    }

    template<std::size_t Index>
    using structureElementTypeByIndex = typename std::tuple_element_t<Index, Fields>::ValueT;

    template<std::size_t Index>
    static constexpr std::string_view structureElementNameByIndex =
        std::tuple_element_t<Index, Fields>::Name.toStringView();

    template<std::size_t Index>
    using ExternalOptions = typename std::tuple_element_t<Index, Fields>::OptionsP;
};


template<class T, std::size_t I, class = void>
struct field_annotation_options {
    using type = OptionsPack<>;
};

template<class T, std::size_t I>
struct field_annotation_options<T, I, std::void_t<typename AnnotatedField<T, I>::Options>> {
    using type = typename AnnotatedField<T, I>::Options;
};

} // namespace detail


template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(StructT & s) {
    using Impl = detail::IntrospectionImpl<std::remove_cv_t<StructT>>;
    return (Impl::template getStructElementByIndex<Index>(s));
}

template<class StructT>
inline constexpr std::size_t structureElementsCount = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::structureElementsCount;

template<std::size_t Index, class StructT>
using structureElementTypeByIndex = typename detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementTypeByIndex<Index>;

template<std::size_t Index, class StructT>
inline constexpr std::string_view structureElementNameByIndex = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementNameByIndex<Index>;

template<class StructT>
inline constexpr bool hasExplicitDescriptor = detail::has_struct_meta_specialization<std::remove_cv_t<StructT>>;


// field-site options first
template<class StructT, std::size_t Index>
struct field_opts {
    using Member = structureElementTypeByIndex<Index, StructT>;
    using Meta = options::detail::annotation_meta_getter<Member>;
    using SiteOpts = std::conditional_t<
        hasExplicitDescriptor<StructT>,
        typename detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template ExternalOptions<Index>,
        typename detail::field_annotation_options<std::remove_cv_t<StructT>, Index>::type
        >;
    using options = options::detail::field_options<
        typename options::detail::merge_options<SiteOpts, typename Meta::OptionsP>::type
        >;
};

template<class StructT, std::size_t Index>
using field_opts_getter = typename field_opts<std::remove_cvref_t<StructT>, Index>::options;


template<class StructT, std::size_t Index>
consteval std::string_view fieldName() {
    using Opts = field_opts_getter<StructT, Index>;
    if constexpr (Opts::template has_option<options::detail::key_tag>) {
        return Opts::template get_option<options::detail::key_tag>::desc.toStringView();
    } else {
        return structureElementNameByIndex<Index, StructT>;
    }
}

template<class StructT>
inline constexpr std::array<std::string_view, structureElementsCount<StructT>> fieldNames =
    []<std::size_t... I>(std::index_sequence<I...>) consteval {
        return std::array<std::string_view, sizeof...(I)>{ fieldName<StructT, I>()... };
    }(std::make_index_sequence<structureElementsCount<StructT>>{});

template<class StructT>
consteval bool fieldNamesAreUnique() {
    const auto& names = fieldNames<StructT>;
    for(std::size_t i = 0; i < names.size(); i ++) {
        for(std::size_t j = i + 1; j < names.size(); j ++) {
            if(names[i] == names[j]) return false;
        }
    }
    return true;
}

}
}
