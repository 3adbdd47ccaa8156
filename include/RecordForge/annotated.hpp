#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>

namespace RecordForge {

template <typename CharT, std::size_t N> struct ConstString
{
    constexpr ConstString(const CharT (&str)[N+1]) {
        for(std::size_t i = 0; i < N+1; i ++) {
            m_data[i] = str[i];
        }
    }
    CharT m_data[N+1];
    static constexpr std::size_t Length = N;

    // no control characters: names and prefixes end up in paths and generated text
    constexpr bool printable() const {
        for(std::size_t i = 0; i < N; i ++) {
            if(std::uint8_t(m_data[i]) < 32) return false;
        }
        return true;
    }
    constexpr std::string_view toStringView() const {
        return {&m_data[0], &m_data[Length]};
    }
};
template <typename CharT, std::size_t N>
ConstString(const CharT (&str)[N])->ConstString<CharT, N-1>;


template <class... Opts>
struct OptionsPack {};

template <class T, typename... Options>
struct Annotated {
    T value{};
    using value_type = T;

    constexpr Annotated() = default;
    constexpr Annotated(const Annotated&) = default;
    constexpr Annotated(Annotated&&) = default;
    constexpr Annotated& operator=(const Annotated&) = default;
    constexpr Annotated& operator=(Annotated&&) = default;

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated(U&& u) : value(std::forward<U>(u)) {}

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated& operator=(U&& u) {
        value = std::forward<U>(u);
        return *this;
    }

    constexpr operator T&()             { return value; }
    constexpr operator const T&() const { return value; }

    constexpr T*       operator->()       { return std::addressof(value); }
    constexpr const T* operator->() const { return std::addressof(value); }

    constexpr T&       get()       { return value; }
    constexpr const T& get() const { return value; }
};

// options for field #I of a PFR-described record T
template<class T, std::size_t I>
struct AnnotatedField;


template<class T, class... OptsL, class... OptsR>
constexpr bool operator==(const Annotated<T, OptsL...>& lhs,
                          const Annotated<T, OptsR...>& rhs)
{
    return lhs.value == rhs.value;
}

template<class T, class... Opts, class U>
    requires requires (const T& t, const U& u) { t == u; }
constexpr bool operator==(const Annotated<T, Opts...>& lhs, const U& rhs)
{
    return lhs.value == rhs;
}

} // namespace RecordForge
