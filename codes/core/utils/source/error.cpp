#include "utils/error.hpp"

namespace traffic_probe {
namespace utils {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED: return "NOT_INITIALIZED";
        case ErrorCode::OPERATION_FAILED: return "OPERATION_FAILED";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";

        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::FILE_PERMISSION_DENIED: return "FILE_PERMISSION_DENIED";
        case ErrorCode::FILE_READ_ERROR: return "FILE_READ_ERROR";
        case ErrorCode::FILE_WRITE_ERROR: return "FILE_WRITE_ERROR";

        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case ErrorCode::CONFIG_INVALID_LOG_LEVEL: return "CONFIG_INVALID_LOG_LEVEL";

        case ErrorCode::STORE_UNAVAILABLE: return "STORE_UNAVAILABLE";
        case ErrorCode::STORE_LOCK_ERROR: return "STORE_LOCK_ERROR";
        case ErrorCode::STORE_CORRUPTED: return "STORE_CORRUPTED";
        case ErrorCode::RECORD_NOT_FOUND: return "RECORD_NOT_FOUND";

        case ErrorCode::CODEC_INVALID_JSON: return "CODEC_INVALID_JSON";
        case ErrorCode::CODEC_INVALID_FIELD: return "CODEC_INVALID_FIELD";
        case ErrorCode::CODEC_INVALID_BASE64: return "CODEC_INVALID_BASE64";

        default: return "UNKNOWN_ERROR_CODE";
    }
}

const char* error_code_to_description(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "Operation completed successfully";
        case ErrorCode::UNKNOWN_ERROR: return "An unknown error occurred";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::NOT_INITIALIZED: return "Not initialized";
        case ErrorCode::OPERATION_FAILED: return "Operation failed";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";

        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::FILE_PERMISSION_DENIED: return "Permission denied";
        case ErrorCode::FILE_READ_ERROR: return "File read error";
        case ErrorCode::FILE_WRITE_ERROR: return "File write error";

        case ErrorCode::CONFIG_PARSE_ERROR: return "Config parse error";
        case ErrorCode::CONFIG_INVALID_VALUE: return "Invalid config value";
        case ErrorCode::CONFIG_INVALID_LOG_LEVEL: return "Invalid log level";

        case ErrorCode::STORE_UNAVAILABLE: return "Capture store unavailable";
        case ErrorCode::STORE_LOCK_ERROR: return "Capture store lock error";
        case ErrorCode::STORE_CORRUPTED: return "Capture store corrupted";
        case ErrorCode::RECORD_NOT_FOUND: return "Record not found";

        case ErrorCode::CODEC_INVALID_JSON: return "Invalid JSON document";
        case ErrorCode::CODEC_INVALID_FIELD: return "Invalid or missing field";
        case ErrorCode::CODEC_INVALID_BASE64: return "Invalid base64 data";

        default: return "Unknown error";
    }
}

const char* error_kind_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::RECORD_NOT_FOUND:
            return "NotFound";
        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::CODEC_INVALID_JSON:
        case ErrorCode::CODEC_INVALID_FIELD:
        case ErrorCode::CODEC_INVALID_BASE64:
            return "InvalidArgument";
        case ErrorCode::STORE_UNAVAILABLE:
        case ErrorCode::STORE_LOCK_ERROR:
        case ErrorCode::STORE_CORRUPTED:
        case ErrorCode::FILE_NOT_FOUND:
        case ErrorCode::FILE_PERMISSION_DENIED:
        case ErrorCode::FILE_READ_ERROR:
        case ErrorCode::FILE_WRITE_ERROR:
            return "StoreUnavailable";
        default:
            return "InternalError";
    }
}

} // namespace utils
} // namespace traffic_probe
