#ifndef SID_ERROR_CODES_H
#define SID_ERROR_CODES_H

#include <string>

namespace sid {

enum class ErrorCode {
    OK = 0,
    UNKNOWN = -1,
    INVALID_PARAM = -2,
    NOT_FOUND = -3,
    DIMENSION_MISMATCH = -4,
    REJECTED = -5,
    BUFFER_TOO_SMALL = -6,
    OUT_OF_RANGE = -7
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "Success";
        case ErrorCode::UNKNOWN: return "Unknown error";
        case ErrorCode::INVALID_PARAM: return "Invalid parameter";
        case ErrorCode::NOT_FOUND: return "Speaker not found";
        case ErrorCode::DIMENSION_MISMATCH: return "Embedding dimension mismatch";
        case ErrorCode::REJECTED: return "Operation rejected";
        case ErrorCode::BUFFER_TOO_SMALL: return "Output buffer too small";
        case ErrorCode::OUT_OF_RANGE: return "Index out of range";
        default: return "Unknown error code";
    }
}

// Thread-local error message storage
inline thread_local std::string g_last_error;

inline void set_last_error(const std::string& msg) {
    g_last_error = msg;
}

inline void set_last_error(ErrorCode code) {
    g_last_error = error_code_to_string(code);
}

inline void set_last_error(ErrorCode code, const std::string& detail) {
    g_last_error = std::string(error_code_to_string(code)) + ": " + detail;
}

inline void clear_last_error() {
    g_last_error.clear();
}

inline const char* get_last_error() {
    return g_last_error.c_str();
}

} // namespace sid

#endif // SID_ERROR_CODES_H
