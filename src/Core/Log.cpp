/**
 * @file Log.cpp
 * @brief Implementation file.
 */
#include "Core/Log.h"
#include <atomic>
#include <cstring>
#include <stdarg.h>
#include <stdio.h>

namespace {
    std::atomic<const LogHubService*> g_hub{nullptr};
    std::atomic<uint8_t> g_minLevel{(uint8_t)LogLevel::Debug};

    void logVa(LogLevel lvl, const char* tag, const char* fmt, va_list ap) {
        const LogHubService* hub = g_hub.load();
        if (!hub || !hub->enqueue || !fmt) return;
        if ((uint8_t)lvl < g_minLevel.load()) return;

        LogEntry e{};
        e.ts_ms = 0;
        e.lvl = lvl;

        strncpy(e.tag, tag ? tag : "-", LOG_TAG_MAX - 1);
        vsnprintf(e.msg, LOG_MSG_MAX, fmt, ap);
        hub->enqueue(hub->ctx, e);
    }
}

void Log::setHub(const LogHubService* hub) {
    g_hub.store(hub);
}

const LogHubService* Log::hub() {
    return g_hub.load();
}

void Log::setMinLevel(LogLevel lvl) {
    g_minLevel.store((uint8_t)lvl);
}

LogLevel Log::minLevel() {
    return (LogLevel)g_minLevel.load();
}

void Log::logf(LogLevel lvl, const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(lvl, tag, fmt, ap);
    va_end(ap);
}

void Log::debug(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Debug, tag, fmt, ap);
    va_end(ap);
}

void Log::info(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Info, tag, fmt, ap);
    va_end(ap);
}

void Log::warn(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Warn, tag, fmt, ap);
    va_end(ap);
}

void Log::error(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Error, tag, fmt, ap);
    va_end(ap);
}
