/**
 * @file LogHub.cpp
 * @brief Implementation file.
 */
#include "Core/LogHub.h"
#include <Arduino.h>

bool LogHub::init(int queueLen) {
    if (q) return true;
    q = xQueueCreate(queueLen, sizeof(LogEntry));
    return q != nullptr;
}

bool LogHub::enqueue(const LogEntry& e) {
    if (!q) return false;
    LogEntry stamped = e;
    stamped.ts_ms = millis();
    if (xQueueSend(q, &stamped, 0) == pdTRUE) return true;  ///< non-blocking
    dropped_.fetch_add(1);
    return false;
}

bool LogHub::dequeue(LogEntry& out, TickType_t waitTicks) {
    if (!q) return false;
    return xQueueReceive(q, &out, waitTicks) == pdTRUE;
}
