#pragma once
/**
 * @file ErrorCodes.h
 * @brief Shared error codes and JSON error payload formatting helpers.
 */

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

enum class ErrorCode : uint16_t {
    None = 0,
    InvalidArg,
    DuplicateName,
    NotFound,
    Full,
    Busy,
    NotReady,
    IoError,
    Unsupported,
    EncodeFailed,
    PublishFailed,
    UnknownTopic,
    BusConnectFailed,
    InitFailed,
    Failed
};

static inline const char* errorCodeStr(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None: return "None";
    case ErrorCode::InvalidArg: return "InvalidArg";
    case ErrorCode::DuplicateName: return "DuplicateName";
    case ErrorCode::NotFound: return "NotFound";
    case ErrorCode::Full: return "Full";
    case ErrorCode::Busy: return "Busy";
    case ErrorCode::NotReady: return "NotReady";
    case ErrorCode::IoError: return "IoError";
    case ErrorCode::Unsupported: return "Unsupported";
    case ErrorCode::EncodeFailed: return "EncodeFailed";
    case ErrorCode::PublishFailed: return "PublishFailed";
    case ErrorCode::UnknownTopic: return "UnknownTopic";
    case ErrorCode::BusConnectFailed: return "BusConnectFailed";
    case ErrorCode::InitFailed: return "InitFailed";
    case ErrorCode::Failed: return "Failed";
    default: return "Unknown";
    }
}

static inline bool errorCodeRetryable(ErrorCode code)
{
    switch (code) {
    case ErrorCode::NotReady:
    case ErrorCode::IoError:
    case ErrorCode::Busy:
    case ErrorCode::PublishFailed:
        return true;
    default:
        return false;
    }
}

static inline bool writeErrorJson(char* out, size_t outLen, ErrorCode code, const char* where)
{
    if (!out || outLen == 0) return false;
    const char* w = (where && where[0] != '\0') ? where : "unknown";
    const int wrote = snprintf(
        out,
        outLen,
        "{\"ok\":false,\"err\":{\"code\":\"%s\",\"where\":\"%s\",\"retryable\":%s}}",
        errorCodeStr(code),
        w,
        errorCodeRetryable(code) ? "true" : "false"
    );
    return (wrote > 0) && ((size_t)wrote < outLen);
}
