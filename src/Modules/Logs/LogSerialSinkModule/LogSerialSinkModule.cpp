/**
 * @file LogSerialSinkModule.cpp
 * @brief Implementation file.
 */
#include "LogSerialSinkModule.h"
#include <Arduino.h>

static const char* levelColor(LogLevel lvl)
{
    switch (lvl) {
        case LogLevel::Debug: return "\x1b[90m";
        case LogLevel::Info:  return "\x1b[32m";
        case LogLevel::Warn:  return "\x1b[33m";
        case LogLevel::Error: return "\x1b[31m";
    }
    return "";
}

static void formatUptime(char* out, size_t outSize, uint32_t ms)
{
    const uint32_t s = ms / 1000;
    snprintf(out, outSize, "%02lu:%02lu:%02lu.%03lu",
             (unsigned long)((s / 3600) % 24),
             (unsigned long)((s / 60) % 60),
             (unsigned long)(s % 60),
             (unsigned long)(ms % 1000));
}

void LogSerialSinkModule::write_(void* ctx, const LogEntry& e)
{
    const LogSerialSinkModule* self = static_cast<const LogSerialSinkModule*>(ctx);

    char ts[16];
    formatUptime(ts, sizeof(ts), e.ts_ms);

    if (self && self->colors_) {
        Serial.printf("[%s][%s][%s] %s%s\x1b[0m\n", ts, logLevelLetter(e.lvl), e.tag,
                      levelColor(e.lvl), e.msg);
    } else {
        Serial.printf("[%s][%s][%s] %s\n", ts, logLevelLetter(e.lvl), e.tag, e.msg);
    }
}

void LogSerialSinkModule::init(ConfigStore&, ServiceRegistry& services)
{
    LogSinkRegistryService* sinks = services.get<LogSinkRegistryService>("logsinks");
    if (!sinks || !sinks->add) {
        Serial.println("logs.serial: no sink registry, serial logging disabled");
        return;
    }

    LogSinkService sink{};
    sink.write = &LogSerialSinkModule::write_;
    sink.ctx = this;
    if (!sinks->add(sinks->ctx, sink)) {
        Serial.println("logs.serial: sink table full, serial logging disabled");
    }
}
