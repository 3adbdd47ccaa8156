#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "path.hpp"
#include "errors.hpp"

namespace RecordForge {


template <class T>
class GenerateResult {
    std::optional<T> m_value;
    GenerateError m_error = GenerateError::NO_ERROR;
    std::string m_rootName;
    std::string m_fieldTypeName;

    path::Path currentPath;

public:
    using value_type = T;

    GenerateResult(T && value, std::string_view rootName):
        m_value(std::move(value)), m_rootName(rootName)
    {}

    GenerateResult(GenerateError err, std::string_view rootName, path::Path p, std::string_view fieldType):
        m_error(err), m_rootName(rootName), m_fieldTypeName(fieldType), currentPath(std::move(p))
    {}

    operator bool() const {
        return m_error == GenerateError::NO_ERROR;
    }

    GenerateError error() const {
        return m_error;
    }
    const path::Path & errorPath() const {
        return currentPath;
    }
    /// "Order.customer.email"; just the record name when the error is not tied to a field.
    std::string errorPathString() const {
        return currentPath.toString(m_rootName);
    }
    std::string_view rootName() const {
        return m_rootName;
    }
    /// Declared type of the offending field, empty on success.
    std::string_view fieldTypeName() const {
        return m_fieldTypeName;
    }

    // value() and operator-> throw std::bad_optional_access on a failed result
    T & value() & { return m_value.value(); }
    const T & value() const & { return m_value.value(); }
    T && value() && { return std::move(m_value).value(); }

    T * operator->() { return std::addressof(m_value.value()); }
    const T * operator->() const { return std::addressof(m_value.value()); }
};

} // namespace RecordForge
