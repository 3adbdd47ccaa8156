#pragma once

#include <string_view>
namespace RecordForge {


enum class GenerateError {
    NO_ERROR,

    NOT_A_RECORD_TYPE,
    UNSUPPORTED_FIELD_TYPE,
    SEQUENCE_VALUE_OUT_OF_RANGE,

    UNKNOWN_FIELD,
    TYPE_MISMATCH
};

constexpr std::string_view error_to_string(GenerateError e) {
    switch(e) {
    case GenerateError::NO_ERROR: return "NO_ERROR"; break;
    case GenerateError::NOT_A_RECORD_TYPE: return "NOT_A_RECORD_TYPE"; break;
    case GenerateError::UNSUPPORTED_FIELD_TYPE: return "UNSUPPORTED_FIELD_TYPE"; break;
    case GenerateError::SEQUENCE_VALUE_OUT_OF_RANGE: return "SEQUENCE_VALUE_OUT_OF_RANGE"; break;
    case GenerateError::UNKNOWN_FIELD: return "UNKNOWN_FIELD"; break;
    case GenerateError::TYPE_MISMATCH: return "TYPE_MISMATCH"; break;
    }
    return "N/A";
}

} // namespace RecordForge
