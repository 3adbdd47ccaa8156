#pragma once

#include <algorithm>
#include <any>
#include <cctype>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <type_traits>
#include <utility>
#include <vector>

#include "static_schema.hpp"
#include "sequence_counter.hpp"

namespace RecordForge {

struct FieldInfo {
    std::string_view name;       // field key, options::key honoured
    std::string path;            // below the root record: "customer.email", "lines[1]"
    std::string_view type_name;  // declared value type
    std::type_index type;
    FieldKind kind;
};

using RuleMatcher = std::function<bool(const FieldInfo&)>;
using RuleProducer = std::function<std::any(const FieldInfo&, SequenceCounter&)>;

struct CustomRule {
    std::string label;
    RuleMatcher matcher;
    RuleProducer producer;
};

/// User rules, consulted before the built-in ones. The most recently added rule whose
/// matcher accepts the field wins.
class RuleSet {
    std::vector<CustomRule> m_rules;

public:
    void add(CustomRule rule) {
        m_rules.push_back(std::move(rule));
    }

    const CustomRule * find(const FieldInfo & field) const {
        for(auto it = m_rules.rbegin(); it != m_rules.rend(); ++ it) {
            if(it->matcher && it->matcher(field)) {
                return &*it;
            }
        }
        return nullptr;
    }

    std::size_t size() const { return m_rules.size(); }
    bool empty() const { return m_rules.empty(); }
};


namespace rules_detail {

inline bool contains_ci(std::string_view haystack, std::string_view needle) {
    if(needle.empty()) return true;
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

/// Value of type F held by `a`. A `const char*` is accepted for std::string fields;
/// nothing else converts.
template<class F>
std::optional<F> any_value_as(const std::any & a) {
    if constexpr (std::is_copy_constructible_v<F>) {
        if(const F * v = std::any_cast<F>(&a)) {
            return *v;
        }
        if constexpr (std::is_same_v<F, std::string>) {
            if(const char * const * s = std::any_cast<const char*>(&a)) {
                if(*s != nullptr) return std::string(*s);
            }
        }
    }
    return std::nullopt;
}

} // namespace rules_detail


namespace rules {

inline RuleMatcher field_named(std::string name) {
    return [name = std::move(name)](const FieldInfo & f) { return f.name == name; };
}

// case-insensitive
inline RuleMatcher name_contains(std::string fragment) {
    return [fragment = std::move(fragment)](const FieldInfo & f) {
        return rules_detail::contains_ci(f.name, fragment);
    };
}

template<class T>
RuleMatcher of_type() {
    return [](const FieldInfo & f) { return f.type == std::type_index(typeid(T)); };
}

inline RuleMatcher of_kind(FieldKind kind) {
    return [kind](const FieldInfo & f) { return f.kind == kind; };
}

inline RuleMatcher all_of(RuleMatcher a, RuleMatcher b) {
    return [a = std::move(a), b = std::move(b)](const FieldInfo & f) { return a(f) && b(f); };
}

} // namespace rules

} // namespace RecordForge
