#pragma once

#include <algorithm>
#include <any>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <typeindex>
#include <utility>

#include "static_schema.hpp"
#include "options.hpp"
#include "struct_introspection.hpp"
#include "type_name.hpp"
#include "errors.hpp"
#include "path.hpp"
#include "generate_result.hpp"
#include "rules.hpp"
#include "builtin_rules.hpp"
#include "generation_context.hpp"
#include "error_formatting.hpp"
#include "logging.hpp"

namespace RecordForge {

namespace generator_details {


// first error, its path and the declared type of the field it happened on
class BuildContext {
    GenerateError error = GenerateError::NO_ERROR;
    std::string m_fieldTypeName;
    std::string_view m_rootName;

    path::Path currentPath;

public:
    explicit BuildContext(std::string_view rootName, std::size_t expectedDepth = 0):
        m_rootName(rootName), currentPath(expectedDepth)
    {}

    struct PathGuard {
        BuildContext & ctx;

        ~PathGuard() {
            if(ctx.error == GenerateError::NO_ERROR)
                ctx.currentPath.pop();
        }
    };

    bool withError(GenerateError err, std::string_view fieldType) {
        error = err;
        m_fieldTypeName = fieldType;
        return false;
    }
    GenerateError currentError() const { return error; }

    const path::Path & path() const { return currentPath; }
    std::string_view rootName() const { return m_rootName; }

    PathGuard getFieldGuard(std::string_view name) {
        currentPath.push_child({name});
        return PathGuard{*this};
    }
    PathGuard getArrayItemGuard(std::size_t index) {
        currentPath.push_child({index});
        return PathGuard{*this};
    }

    template<class T>
    GenerateResult<T> result(std::optional<T> && value) {
        if(error == GenerateError::NO_ERROR && value) {
            return GenerateResult<T>(std::move(*value), m_rootName);
        }
        return GenerateResult<T>(error, m_rootName, currentPath, m_fieldTypeName);
    }
};


template<class T, class... Args>
T construct(Args&&... args) {
    if constexpr (requires { T{std::forward<Args>(args)...}; }) {
        return T{std::forward<Args>(args)...};
    } else {
        return T(std::forward<Args>(args)...);
    }
}

template<class Field, class Opts>
std::optional<Field> GenerateField(std::string_view name, GenerationContext & gctx, BuildContext & ctx);

template<class T>
std::optional<T> GenerateRecord(GenerationContext & gctx, BuildContext & ctx);


template<class Opts>
std::string stringFor(BuiltinRule rule, std::int64_t seq, const GenerationConfig & cfg) {
    if(rule == BuiltinRule::synthesized_email) {
        return std::format("{}-{}@{}", cfg.email_prefix, seq, cfg.email_domain);
    }
    if constexpr (Opts::template has_option<options::detail::string_prefix_tag>) {
        using Opt = typename Opts::template get_option<options::detail::string_prefix_tag>;
        return std::format("{}-{}", Opt::desc.toStringView(), seq);
    } else {
        return std::format("{}-{}", cfg.string_prefix, seq);
    }
}

template<class V>
std::optional<std::int64_t> draw(GenerationContext & gctx, BuildContext & ctx) {
    std::optional<std::int64_t> seq = gctx.counter().tryNext();
    if(!seq) {
        ctx.withError(GenerateError::SEQUENCE_VALUE_OUT_OF_RANGE, type_name<V>);
    }
    return seq;
}

template<class E, class Opts, std::size_t N, std::size_t... I>
std::optional<std::array<E, N>> GenerateElements(std::string_view name, GenerationContext & gctx, BuildContext & ctx,
                                                 std::index_sequence<I...>) {
    std::array<std::optional<E>, N> elements;

    auto generateOne = [&]<std::size_t Index>(std::integral_constant<std::size_t, Index>) {
        BuildContext::PathGuard guard = ctx.getArrayItemGuard(Index);
        std::optional<E> v = GenerateField<E, Opts>(name, gctx, ctx);
        if(!v) {
            return false;
        }
        elements[Index].emplace(std::move(*v));
        return true;
    };

    if(!(generateOne(std::integral_constant<std::size_t, I>{}) && ...)) {
        return std::nullopt;
    }
    return std::array<E, N>{ std::move(*elements[I])... };
}


template<class V, class Opts>
std::optional<V> GenerateBuiltin(const FieldInfo & info, GenerationContext & gctx, BuildContext & ctx) {
    const BuiltinRule rule = builtin_rules::resolve<V, Opts>(info.name);

    if(auto log = logging::logger(); log->should_log(spdlog::level::debug)) {
        log->debug("{} <- {}", ctx.path().toString(ctx.rootName()), rule_to_string(rule));
    }

    constexpr FieldKind kind = static_schema::field_kind_v<V>;

    if constexpr (kind == FieldKind::enumeration) {
        if constexpr (DescribedEnum<V>) {
            return firstEnumVariant<V>();
        } else {
            ctx.withError(GenerateError::UNSUPPORTED_FIELD_TYPE, type_name<V>);
            return std::nullopt;
        }
    } else if constexpr (kind == FieldKind::optional
                         || kind == FieldKind::sequence
                         || kind == FieldKind::mapping) {
        return std::optional<V>(std::in_place);
    } else if constexpr (kind == FieldKind::fixed_array) {
        using Arr = static_schema::is_std_array<V>;
        using E = typename Arr::element_type;
        using ElemOpts = options::detail::field_options<
            typename options::detail::merge_options<
                typename Opts::pack,
                typename options::detail::annotation_meta_getter<E>::OptionsP
                >::type
            >;
        return GenerateElements<E, ElemOpts, Arr::size>(info.name, gctx, ctx, std::make_index_sequence<Arr::size>{});
    } else if constexpr (kind == FieldKind::record) {
        return GenerateRecord<V>(gctx, ctx);
    } else if constexpr (kind == FieldKind::string) {
        std::optional<std::int64_t> seq = draw<V>(gctx, ctx);
        if(!seq) {
            return std::nullopt;
        }
        std::string text = stringFor<Opts>(rule, *seq, gctx.config());
        if constexpr (static_schema::static_string_traits<V>::is_static) {
            V out{};
            std::size_t n = std::min(text.size(), static_schema::static_string_traits<V>::max_size());
            std::copy_n(text.begin(), n, out.begin());
            if(n < out.size()) out[n] = '\0';
            return out;
        } else if constexpr (std::is_same_v<V, std::string>) {
            return text;
        } else {
            return V(text.data(), text.size());
        }
    } else if constexpr (kind == FieldKind::boolean) {
        return false;
    } else if constexpr (kind == FieldKind::integer) {
        std::optional<std::int64_t> seq = draw<V>(gctx, ctx);
        if(!seq) {
            return std::nullopt;
        }
        if(!std::in_range<V>(*seq)) {
            ctx.withError(GenerateError::SEQUENCE_VALUE_OUT_OF_RANGE, type_name<V>);
            return std::nullopt;
        }
        return static_cast<V>(*seq);
    } else if constexpr (kind == FieldKind::floating) {
        std::optional<std::int64_t> seq = draw<V>(gctx, ctx);
        if(!seq) {
            return std::nullopt;
        }
        return static_cast<V>(*seq);
    } else if constexpr (kind == FieldKind::temporal) {
        if constexpr (builtin_rules::detail::ClockWithNow<V>) {
            return std::chrono::time_point_cast<typename V::duration>(V::clock::now());
        } else {
            ctx.withError(GenerateError::UNSUPPORTED_FIELD_TYPE, type_name<V>);
            return std::nullopt;
        }
    } else if constexpr (kind == FieldKind::opaque) {
        ctx.withError(GenerateError::NOT_A_RECORD_TYPE, type_name<V>);
        return std::nullopt;
    } else {
        ctx.withError(GenerateError::UNSUPPORTED_FIELD_TYPE, type_name<V>);
        return std::nullopt;
    }
}


// custom rules first, then built-ins
template<class Field, class Opts>
std::optional<Field> GenerateField(std::string_view name, GenerationContext & gctx, BuildContext & ctx) {
    using Meta = options::detail::annotation_meta_getter<Field>;
    using V = typename Meta::value_t;

    const RuleSet & custom = gctx.rules();
    FieldInfo info{
        name,
        custom.empty() ? std::string{} : ctx.path().toString(),
        type_name<V>,
        std::type_index(typeid(V)),
        static_schema::field_kind_v<Field>
    };

    if(const CustomRule * rule = custom.empty() ? nullptr : custom.find(info)) {
        logging::logger()->debug("{} <- {}", ctx.path().toString(ctx.rootName()), rule->label);
        std::any produced = rule->producer(info, gctx.counter());
        std::optional<V> v = rules_detail::any_value_as<V>(produced);
        if(!v) {
            ctx.withError(GenerateError::TYPE_MISMATCH, type_name<V>);
            return std::nullopt;
        }
        return Meta::wrap(std::move(*v));
    }

    std::optional<V> v = GenerateBuiltin<V, Opts>(info, gctx, ctx);
    if(!v) {
        return std::nullopt;
    }
    return Meta::wrap(std::move(*v));
}


template<class T, std::size_t I>
bool GenerateRecordField(std::optional<introspection::structureElementTypeByIndex<I, T>> & out,
                         GenerationContext & gctx, BuildContext & ctx) {
    using F = introspection::structureElementTypeByIndex<I, T>;
    using Opts = introspection::field_opts_getter<T, I>;
    constexpr std::string_view name = introspection::fieldName<T, I>();

    BuildContext::PathGuard guard = ctx.getFieldGuard(name);
    std::optional<F> v = GenerateField<F, Opts>(name, gctx, ctx);
    if(!v) {
        return false;
    }
    out.emplace(std::move(*v));
    return true;
}

template<class T>
std::optional<T> GenerateRecord(GenerationContext & gctx, BuildContext & ctx) {
    static_assert(introspection::fieldNamesAreUnique<T>(),
                  "[[[ RecordForge ]]] Two fields of the record share a name (check options::key)");

    return [&]<std::size_t... I>(std::index_sequence<I...>) -> std::optional<T> {
        std::tuple<std::optional<introspection::structureElementTypeByIndex<I, T>>...> values;
        if(!(GenerateRecordField<T, I>(std::get<I>(values), gctx, ctx) && ...)) {
            return std::nullopt;
        }
        return construct<T>(std::move(*std::get<I>(values))...);
    }(std::make_index_sequence<introspection::structureElementsCount<T>>{});
}

template<class T>
GenerateResult<T> Report(GenerateResult<T> && res) {
    if(!res) {
        logging::logger()->warn("{}", GenerateResultToString(res));
    }
    return std::move(res);
}

} // namespace generator_details


template <class T>
    requires static_schema::RecordLike<T>
GenerateResult<T> Generate(GenerationContext & ctx = default_context()) {
    static_assert(schema_analysis::within_nesting_limit<T>(),
                  "[[[ RecordForge ]]] Record nesting exceeds RECORDFORGE_MAX_NESTING_DEPTH");

    generator_details::BuildContext bctx(record_name<T>(), schema_analysis::calc_generation_depth<T>());
    std::optional<T> value = generator_details::GenerateRecord<T>(ctx, bctx);
    return generator_details::Report(bctx.result(std::move(value)));
}

template <class T, class... Args>
    requires (!static_schema::RecordLike<T>)
auto Generate(Args&&...) {
    static_assert(static_schema::detail::always_false<T>::value,
                  "[[[ RecordForge ]]] T is not a record type: an aggregate PFR can enumerate, "
                  "or a class with a StructMeta<T> descriptor");
}

} // namespace RecordForge
