#pragma once

#include <string>
#include <utility>

namespace tilecut::core {

enum class ErrorKind {
    none,
    source_not_found,
    invalid_path_kind,
    decode_error,
    encode_error,
    config_conflict,
    invalid_geometry,
    output_error
};

struct Error {
    ErrorKind kind = ErrorKind::none;
    std::string message;
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::none: return "none";
        case ErrorKind::source_not_found: return "SourceNotFound";
        case ErrorKind::invalid_path_kind: return "InvalidPathKind";
        case ErrorKind::decode_error: return "DecodeError";
        case ErrorKind::encode_error: return "EncodeError";
        case ErrorKind::config_conflict: return "ConfigConflict";
        case ErrorKind::invalid_geometry: return "InvalidGeometry";
        case ErrorKind::output_error: return "OutputError";
    }
    return "unknown";
}

// Fills `error` and returns false so call sites can `return fail(...)`.
inline bool fail(Error& error, ErrorKind kind, std::string message) {
    error.kind = kind;
    error.message = std::move(message);
    return false;
}

} // namespace tilecut::core
