#pragma once
/**
 * @file ILogger.h
 * @brief Logging service interfaces shared by the core and the log modules.
 */
#include <stdint.h>
#include <stddef.h>

/** @brief Log severity levels. */
enum class LogLevel : uint8_t { Debug, Info, Warn, Error };

// ===== LOG TYPES =====
constexpr int LOG_TAG_MAX = 10;
constexpr int LOG_MSG_MAX = 110;

/** @brief Fixed-size log entry. Timestamp is stamped by the hub. */
struct LogEntry {
    uint32_t ts_ms;
    LogLevel lvl;
    char tag[LOG_TAG_MAX];
    char msg[LOG_MSG_MAX];
};

/** @brief Log sink interface. */
struct LogSinkService {
    void (*write)(void* ctx, const LogEntry& e);
    void* ctx;
};

/** @brief Log hub interface (producer side). */
struct LogHubService {
    bool (*enqueue)(void* ctx, const LogEntry& e);
    void* ctx;
};

/** @brief Registry interface for log sinks. */
struct LogSinkRegistryService {
    bool (*add)(void* ctx, LogSinkService sink);
    int (*count)(void* ctx);
    LogSinkService (*get)(void* ctx, int index);
    void* ctx;
};

/** @brief Short level letter used by sinks ("D", "I", "W", "E"). */
inline const char* logLevelLetter(LogLevel lvl)
{
    switch (lvl) {
        case LogLevel::Debug: return "D";
        case LogLevel::Info: return "I";
        case LogLevel::Warn: return "W";
        case LogLevel::Error: return "E";
        default: return "?";
    }
}
