#pragma once

#include <string>

namespace loan::domain {

enum class ErrorCode {
    INVALID_INPUT,
    INVALID_DATE,
    INVALID_TERM
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_INPUT: return "INVALID_INPUT";
        case ErrorCode::INVALID_DATE: return "INVALID_DATE";
        case ErrorCode::INVALID_TERM: return "INVALID_TERM";
        default: return "UNKNOWN";
    }
}

} // namespace loan::domain
