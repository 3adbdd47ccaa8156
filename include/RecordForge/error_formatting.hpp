#pragma once

#include <format>
#include <string>

#include "errors.hpp"
#include "generate_result.hpp"

namespace RecordForge {

/// "When generating Order.customer.email, error 'UNSUPPORTED_FIELD_TYPE' (declared type: float*)"
template <class T>
std::string GenerateResultToString(const GenerateResult<T> & res) {
    if(res) {
        return std::format("Generated {}", res.rootName());
    }
    std::string typeInfo;
    if(!res.fieldTypeName().empty()) {
        typeInfo = std::format(" (declared type: {})", res.fieldTypeName());
    }
    return std::format("When generating {}, error '{}'{}", res.errorPathString(), error_to_string(res.error()), typeInfo);
}

} // namespace RecordForge
