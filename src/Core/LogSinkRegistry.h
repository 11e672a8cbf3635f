#pragma once
/**
 * @file LogSinkRegistry.h
 * @brief Registry of log sinks.
 */
#include "Core/Services/ILogger.h"

/**
 * @brief Stores and enumerates registered log sinks.
 */
class LogSinkRegistry {
public:
    /** @brief Add a sink to the registry. Sinks without a write callback are refused. */
    bool add(LogSinkService sink);
    int count() const { return n; }
    /** @brief Get sink by index, or an empty sink when out of range. */
    LogSinkService get(int idx) const;

private:
    static constexpr int MAX_SINKS = 3;
    LogSinkService sinks[MAX_SINKS]{};
    int n = 0;
};
