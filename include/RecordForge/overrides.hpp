#pragma once

#include <any>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "static_schema.hpp"
#include "struct_introspection.hpp"
#include "type_name.hpp"
#include "errors.hpp"
#include "generate_result.hpp"
#include "rules.hpp"
#include "generator.hpp"

namespace RecordForge {

namespace overrides_detail {

// string literals are stored as std::string, everything else as given
template<class V>
std::any normalize(V && v) {
    using D = std::decay_t<V>;
    if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>) {
        return std::any(std::string(v));
    } else {
        return std::any(std::forward<V>(v));
    }
}

} // namespace overrides_detail


struct OverrideEntry {
    std::string path;
    std::any value;

    template<class V>
    OverrideEntry(std::string p, V && v):
        path(std::move(p)), value(overrides_detail::normalize(std::forward<V>(v)))
    {}
};

// string literals are stored as std::string, nothing else converts
class Overrides {
    std::map<std::string, std::any, std::less<>> m_entries;

public:
    Overrides() = default;

    Overrides(std::initializer_list<OverrideEntry> entries) {
        for(const OverrideEntry & e : entries) {
            m_entries.insert_or_assign(e.path, e.value);
        }
    }

    template<class V>
    Overrides & set(std::string path, V && value) {
        m_entries.insert_or_assign(std::move(path), overrides_detail::normalize(std::forward<V>(value)));
        return *this;
    }

    const std::any * find(std::string_view path) const {
        auto it = m_entries.find(path);
        return it == m_entries.end() ? nullptr : &it->second;
    }
    bool contains(std::string_view path) const { return find(path) != nullptr; }

    std::size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    auto begin() const { return m_entries.begin(); }
    auto end() const { return m_entries.end(); }
};


namespace merger_details {

using generator_details::BuildContext;

struct Entry {
    std::string_view path;   // relative to the record being merged
    const std::any * value;
};

inline std::vector<Entry> collect(const Overrides & overrides) {
    std::vector<Entry> entries;
    entries.reserve(overrides.size());
    for(const auto & [path, value] : overrides) {
        entries.push_back(Entry{path, &value});
    }
    return entries;
}

inline std::pair<std::string_view, std::string_view> splitHead(std::string_view p) {
    std::size_t dot = p.find('.');
    if(dot == std::string_view::npos) {
        return {p, {}};
    }
    return {p.substr(0, dot), p.substr(dot + 1)};
}

template<class F>
std::optional<F> overrideValueAs(const std::any & a) {
    using Meta = options::detail::annotation_meta_getter<F>;
    using V = typename Meta::value_t;
    if constexpr (!std::is_same_v<V, F>) {
        if(std::optional<F> wrapped = rules_detail::any_value_as<F>(a)) {
            return wrapped;
        }
    }
    if(std::optional<V> v = rules_detail::any_value_as<V>(a)) {
        return Meta::wrap(std::move(*v));
    }
    return std::nullopt;
}


template<class T>
bool ValidatePath(std::string_view path, BuildContext & ctx);

// `descends` is set when the key continues past this field, even with an empty
// segment ("address." names no field of address)
template<class T, std::size_t I>
bool ValidateBelow(std::string_view rest, bool descends, BuildContext & ctx) {
    if(!descends) {
        return true;
    }
    using F = introspection::structureElementTypeByIndex<I, T>;
    if constexpr (static_schema::field_kind_v<F> == FieldKind::record) {
        return ValidatePath<static_schema::AnnotatedValue<F>>(rest, ctx);
    } else {
        BuildContext::PathGuard guard = ctx.getFieldGuard(splitHead(rest).first);
        return ctx.withError(GenerateError::UNKNOWN_FIELD, {});
    }
}

template<class T>
bool ValidatePath(std::string_view path, BuildContext & ctx) {
    auto [head, rest] = splitHead(path);
    const bool descends = head.size() < path.size();
    BuildContext::PathGuard guard = ctx.getFieldGuard(head);

    return [&]<std::size_t... I>(std::index_sequence<I...>) {
        bool found = false;
        bool ok = true;
        ((introspection::fieldName<T, I>() == head
              ? (found = true, ok = ValidateBelow<T, I>(rest, descends, ctx), true)
              : false) || ...);
        if(!found) {
            return ctx.withError(GenerateError::UNKNOWN_FIELD, {});
        }
        return ok;
    }(std::make_index_sequence<introspection::structureElementsCount<T>>{});
}

// dotted keys only go through record fields
template<class T>
bool ValidatePaths(std::span<const Entry> entries, BuildContext & ctx) {
    for(const Entry & e : entries) {
        if(!ValidatePath<T>(e.path, ctx)) {
            return false;
        }
    }
    return true;
}


template<class T>
std::optional<T> MergeRecord(T && instance, std::span<const Entry> entries, BuildContext & ctx);

template<class T, std::size_t I>
bool MergeField(T & instance, std::span<const Entry> entries,
                std::optional<introspection::structureElementTypeByIndex<I, T>> & out, BuildContext & ctx) {
    using F = introspection::structureElementTypeByIndex<I, T>;
    using Meta = options::detail::annotation_meta_getter<F>;
    using V = typename Meta::value_t;
    constexpr std::string_view name = introspection::fieldName<T, I>();

    const Entry * whole = nullptr;
    std::vector<Entry> nested;
    for(const Entry & e : entries) {
        auto [head, rest] = splitHead(e.path);
        if(head != name) continue;
        if(rest.empty()) {
            whole = &e;
        } else {
            nested.push_back(Entry{rest, e.value});
        }
    }

    BuildContext::PathGuard guard = ctx.getFieldGuard(name);

    std::optional<F> current;
    if(whole != nullptr) {
        std::optional<F> replaced = overrideValueAs<F>(*whole->value);
        if(!replaced) {
            return ctx.withError(GenerateError::TYPE_MISMATCH, type_name<V>);
        }
        current.emplace(std::move(*replaced));
    } else {
        current.emplace(std::move(introspection::getStructElementByIndex<I>(instance)));
    }

    if(!nested.empty()) {
        if constexpr (static_schema::field_kind_v<F> == FieldKind::record) {
            std::optional<V> merged = MergeRecord<V>(std::move(Meta::getRef(*current)), nested, ctx);
            if(!merged) {
                return false;
            }
            current.emplace(Meta::wrap(std::move(*merged)));
        } else {
            return ctx.withError(GenerateError::UNKNOWN_FIELD, type_name<V>);
        }
    }

    out.emplace(std::move(*current));
    return true;
}

template<class T>
std::optional<T> MergeRecord(T && instance, std::span<const Entry> entries, BuildContext & ctx) {
    if(entries.empty()) {
        return std::optional<T>(std::move(instance));
    }
    return [&]<std::size_t... I>(std::index_sequence<I...>) -> std::optional<T> {
        std::tuple<std::optional<introspection::structureElementTypeByIndex<I, T>>...> values;
        if(!(MergeField<T, I>(instance, entries, std::get<I>(values), ctx) && ...)) {
            return std::nullopt;
        }
        return generator_details::construct<T>(std::move(*std::get<I>(values))...);
    }(std::make_index_sequence<introspection::structureElementsCount<T>>{});
}

} // namespace merger_details


template <class T>
    requires static_schema::RecordLike<T>
GenerateResult<T> Merge(const T & instance, const Overrides & overrides) {
    generator_details::BuildContext ctx(record_name<T>());
    std::vector<merger_details::Entry> entries = merger_details::collect(overrides);

    if(!merger_details::ValidatePaths<T>(entries, ctx)) {
        return generator_details::Report(ctx.result<T>(std::nullopt));
    }
    T copy = instance;
    return generator_details::Report(ctx.result(merger_details::MergeRecord<T>(std::move(copy), entries, ctx)));
}

template <class T>
    requires (!static_schema::RecordLike<T>)
auto Merge(const T &, const Overrides &) {
    static_assert(static_schema::detail::always_false<T>::value,
                  "[[[ RecordForge ]]] T is not a record type: an aggregate PFR can enumerate, "
                  "or a class with a StructMeta<T> descriptor");
}

// keys are checked before any counter value is drawn
template <class T>
    requires static_schema::RecordLike<T>
GenerateResult<T> Generate(const Overrides & overrides, GenerationContext & ctx = default_context()) {
    static_assert(schema_analysis::within_nesting_limit<T>(),
                  "[[[ RecordForge ]]] Record nesting exceeds RECORDFORGE_MAX_NESTING_DEPTH");

    generator_details::BuildContext bctx(record_name<T>(), schema_analysis::calc_generation_depth<T>());
    std::vector<merger_details::Entry> entries = merger_details::collect(overrides);

    if(!merger_details::ValidatePaths<T>(entries, bctx)) {
        return generator_details::Report(bctx.result<T>(std::nullopt));
    }
    std::optional<T> value = generator_details::GenerateRecord<T>(ctx, bctx);
    if(!value) {
        return generator_details::Report(bctx.result(std::move(value)));
    }
    return generator_details::Report(bctx.result(merger_details::MergeRecord<T>(std::move(*value), entries, bctx)));
}

} // namespace RecordForge
