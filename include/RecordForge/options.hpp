#pragma once
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <optional>
#include <memory>
#include "annotated.hpp"

namespace RecordForge {


namespace options {


namespace detail {

struct key_tag{};
struct email_tag{};
struct string_prefix_tag{};

}

template<ConstString Name>
struct key {
    static_assert(Name.printable(), "[[[ RecordForge ]]] key contains control characters");
    using tag = detail::key_tag;
    static constexpr auto desc = Name;
};

struct email {
    using tag = detail::email_tag;
};

template<ConstString Prefix>
struct string_prefix {
    static_assert(Prefix.printable(), "[[[ RecordForge ]]] string_prefix contains control characters");
    using tag = detail::string_prefix_tag;
    static constexpr auto desc = Prefix;
};


namespace detail {


template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};


template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

// first match wins
template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        typename find_option_by_tag<Tag, Rest...>::type
        >;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {
    using pack = OptionsPack<Opts...>;

    template<class Tag>
    using get_option = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<get_option<Tag>>;
};


template <class P1, class P2> struct merge_options;
template <class ... Opts1, class ... Opts2> struct merge_options<OptionsPack<Opts1...>, OptionsPack<Opts2...>> {
    using type = OptionsPack<Opts1..., Opts2...>;
};


template<class Field>
struct annotation_meta {
    using value_t = Field;
    using OptionsP = OptionsPack<>;

    static constexpr Field& getRef(Field& f) { return f; }
    static constexpr const Field& getRef(const Field& f) { return f; }
    static constexpr Field wrap(Field&& v) { return std::move(v); }
};

template<class T, class... Opts>
struct annotation_meta<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ RecordForge ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using value_t = T;
    using OptionsP = OptionsPack<Opts...>;

    static constexpr T& getRef(Annotated<T, Opts...>& f) { return f.value; }
    static constexpr const T& getRef(const Annotated<T, Opts...>& f) { return f.value; }
    static constexpr Annotated<T, Opts...> wrap(T&& v) { return Annotated<T, Opts...>(std::move(v)); }
};

template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {
    using options = field_options<typename annotation_meta<std::remove_cvref_t<Field>>::OptionsP>;
};


} // namespace detail


} // namespace options

} // namespace RecordForge
