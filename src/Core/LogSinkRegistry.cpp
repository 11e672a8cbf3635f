/**
 * @file LogSinkRegistry.cpp
 * @brief Implementation file.
 */
#include "Core/LogSinkRegistry.h"

bool LogSinkRegistry::add(LogSinkService sink) {
    if (!sink.write || n >= MAX_SINKS) return false;
    sinks[n++] = sink;
    return true;
}

LogSinkService LogSinkRegistry::get(int idx) const {
    if (idx < 0 || idx >= n) return LogSinkService{nullptr, nullptr};
    return sinks[idx];
}
