#pragma once

#include <cstddef>
#include <string_view>
#include <utility>
#include <vector>

#include "static_schema.hpp"
#include "struct_introspection.hpp"
#include "type_name.hpp"

namespace RecordForge {

struct RecordDescriptor;

struct FieldDescriptor {
    std::string_view name;
    std::string_view type_name;
    FieldKind kind;
    bool optional;
    const RecordDescriptor * nested = nullptr;  // set for record fields
};

struct RecordDescriptor {
    std::string_view type_name;
    std::vector<FieldDescriptor> fields;

    const FieldDescriptor * find(std::string_view fieldName) const {
        for(const FieldDescriptor & f : fields) {
            if(f.name == fieldName) return &f;
        }
        return nullptr;
    }
};


template<class T>
    requires static_schema::RecordLike<T>
const RecordDescriptor & Describe();

namespace descriptor_detail {

template<class T, std::size_t I>
FieldDescriptor describeField() {
    using F = introspection::structureElementTypeByIndex<I, T>;
    using V = static_schema::AnnotatedValue<F>;
    constexpr FieldKind kind = static_schema::field_kind_v<F>;

    FieldDescriptor d{
        introspection::fieldName<T, I>(),
        type_name<V>,
        kind,
        kind == FieldKind::optional
    };
    if constexpr (kind == FieldKind::record) {
        d.nested = &Describe<V>();
    }
    return d;
}

} // namespace descriptor_detail


// computed once per type
template<class T>
    requires static_schema::RecordLike<T>
const RecordDescriptor & Describe() {
    static const RecordDescriptor descriptor = [] {
        return [&]<std::size_t... I>(std::index_sequence<I...>) {
            return RecordDescriptor{
                record_name<T>(),
                std::vector<FieldDescriptor>{ descriptor_detail::describeField<T, I>()... }
            };
        }(std::make_index_sequence<introspection::structureElementsCount<T>>{});
    }();
    return descriptor;
}

template <class T>
    requires (!static_schema::RecordLike<T>)
const RecordDescriptor & Describe() {
    static_assert(static_schema::detail::always_false<T>::value,
                  "[[[ RecordForge ]]] T is not a record type: an aggregate PFR can enumerate, "
                  "or a class with a StructMeta<T> descriptor");
}

} // namespace RecordForge
