#pragma once
/**
 * @file ErrorCodes.h
 * @brief Shared error codes and JSON error payload formatting helpers.
 */

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

enum class ErrorCode : uint16_t {
    UnknownCmd = 0,
    BadCmdJson,
    MissingCmd,
    CmdServiceUnavailable,
    ArgsTooLarge,
    CmdHandlerFailed,
    CfgTruncated,
    MissingArgs,
    MissingValue,
    NotReady,
    Disabled,
    Failed,
    InvalidArgument,
    UnrecognizedFormat,
    OutOfRange,
    InvalidState,
    DuplicateIdentifier,
    NotFound,
    RegistryFull,
    TimerUnavailable,
    ClockNotSet,
    PersistFailed
};

static inline const char* errorCodeStr(ErrorCode code)
{
    switch (code) {
    case ErrorCode::UnknownCmd: return "UnknownCmd";
    case ErrorCode::BadCmdJson: return "BadCmdJson";
    case ErrorCode::MissingCmd: return "MissingCmd";
    case ErrorCode::CmdServiceUnavailable: return "CmdServiceUnavailable";
    case ErrorCode::ArgsTooLarge: return "ArgsTooLarge";
    case ErrorCode::CmdHandlerFailed: return "CmdHandlerFailed";
    case ErrorCode::CfgTruncated: return "CfgTruncated";
    case ErrorCode::MissingArgs: return "MissingArgs";
    case ErrorCode::MissingValue: return "MissingValue";
    case ErrorCode::NotReady: return "NotReady";
    case ErrorCode::Disabled: return "Disabled";
    case ErrorCode::Failed: return "Failed";
    case ErrorCode::InvalidArgument: return "InvalidArgument";
    case ErrorCode::UnrecognizedFormat: return "UnrecognizedFormat";
    case ErrorCode::OutOfRange: return "OutOfRange";
    case ErrorCode::InvalidState: return "InvalidState";
    case ErrorCode::DuplicateIdentifier: return "DuplicateIdentifier";
    case ErrorCode::NotFound: return "NotFound";
    case ErrorCode::RegistryFull: return "RegistryFull";
    case ErrorCode::TimerUnavailable: return "TimerUnavailable";
    case ErrorCode::ClockNotSet: return "ClockNotSet";
    case ErrorCode::PersistFailed: return "PersistFailed";
    default: return "Unknown";
    }
}

static inline bool errorCodeRetryable(ErrorCode code)
{
    switch (code) {
    case ErrorCode::CmdServiceUnavailable:
    case ErrorCode::NotReady:
    case ErrorCode::CfgTruncated:
    case ErrorCode::TimerUnavailable:
    case ErrorCode::ClockNotSet:
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

/**
 * @brief Error reply that echoes the user value which caused the rejection.
 *
 * Quotes, backslashes and control characters in `input` are replaced by '?'
 * so the reply stays valid JSON. Input is clipped to 31 characters.
 */
static inline bool writeErrorJsonWithInput(char* out,
                                           size_t outLen,
                                           ErrorCode code,
                                           const char* where,
                                           const char* input)
{
    if (!out || outLen == 0) return false;
    const char* w = (where && where[0] != '\0') ? where : "unknown";
    char safe[32];
    size_t n = 0;
    if (input) {
        for (; input[n] != '\0' && n < sizeof(safe) - 1; ++n) {
            const char c = input[n];
            safe[n] = (c == '"' || c == '\\' || (unsigned char)c < 0x20) ? '?' : c;
        }
    }
    safe[n] = '\0';
    const int wrote = snprintf(
        out,
        outLen,
        "{\"ok\":false,\"input\":\"%s\",\"err\":{\"code\":\"%s\",\"where\":\"%s\",\"retryable\":%s}}",
        safe,
        errorCodeStr(code),
        w,
        errorCodeRetryable(code) ? "true" : "false"
    );
    return (wrote > 0) && ((size_t)wrote < outLen);
}
