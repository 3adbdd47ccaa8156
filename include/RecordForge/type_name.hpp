#pragma once

#include <cstddef>
#include <string_view>

#include "struct_introspection.hpp"

namespace RecordForge {

namespace type_name_detail {

template<class T>
consteval std::string_view raw_signature() {
#if defined(__clang__) || defined(__GNUC__)
    return __PRETTY_FUNCTION__;
#elif defined(_MSC_VER)
    return __FUNCSIG__;
#else
    return {};
#endif
}

template<class T>
consteval std::string_view extract() {
    constexpr std::string_view sig = raw_signature<T>();
#if defined(__clang__) || defined(__GNUC__)
    // clang: "... raw_signature() [T = Foo]"
    // gcc:   "... raw_signature() [with T = Foo; std::string_view = ...]"
    constexpr std::size_t start = sig.find("T = ");
    if constexpr (start == std::string_view::npos) {
        return "unknown";
    } else {
        std::size_t end = sig.find(';', start);
        if(end == std::string_view::npos) {
            end = sig.rfind(']');
        }
        return sig.substr(start + 4, end - start - 4);
    }
#elif defined(_MSC_VER)
    constexpr std::size_t start = sig.find("raw_signature<");
    constexpr std::size_t end = sig.rfind(">(void)");
    std::string_view s = sig.substr(start + 14, end - start - 14);
    for(std::string_view kw : {"struct ", "class ", "enum "}) {
        if(s.starts_with(kw)) s.remove_prefix(kw.size());
    }
    return s;
#else
    return "unknown";
#endif
}

// "ns::Outer::Order" -> "Order", leaves template arguments alone
consteval std::string_view unqualified(std::string_view name) {
    int depth = 0;
    std::size_t cut = 0;
    for(std::size_t i = 0; i < name.size(); i ++) {
        char c = name[i];
        if(c == '<' || c == '(') depth ++;
        else if(c == '>' || c == ')') depth --;
        else if(c == ':' && depth == 0 && i + 1 < name.size() && name[i+1] == ':') {
            cut = i + 2;
            i ++;
        }
    }
    return name.substr(cut);
}

template<class T>
struct explicit_record_name {
    static constexpr bool present = false;
};

template<class T>
    requires requires { { StructMeta<T>::Name } -> std::convertible_to<std::string_view>; }
struct explicit_record_name<T> {
    static constexpr bool present = true;
    static constexpr std::string_view value = StructMeta<T>::Name;
};

} // namespace type_name_detail


template<class T>
inline constexpr std::string_view type_name = type_name_detail::extract<T>();

// StructMeta<T>::Name, or the unqualified type name
template<class T>
consteval std::string_view record_name() {
    if constexpr (type_name_detail::explicit_record_name<T>::present) {
        return type_name_detail::explicit_record_name<T>::value;
    } else {
        return type_name_detail::unqualified(type_name<T>);
    }
}

} // namespace RecordForge
