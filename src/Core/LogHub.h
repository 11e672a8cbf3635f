#pragma once
/**
 * @file LogHub.h
 * @brief Central log queue for asynchronous logging.
 */
#include "Core/Services/ILogger.h"
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <atomic>

/**
 * @brief Queue-based log hub for producers and consumers.
 */
class LogHub {
public:
    /** @brief Initialize the log queue with a given length. */
    bool init(int queueLen);

    /** @brief Stamp and enqueue a log entry (non-blocking). */
    bool enqueue(const LogEntry& e);
    /** @brief Dequeue a log entry (blocking up to waitTicks). */
    bool dequeue(LogEntry& out, TickType_t waitTicks);

    /** @brief Entries dropped because the queue was full. */
    uint32_t dropped() const { return dropped_.load(); }

private:
    QueueHandle_t q = nullptr;
    std::atomic<uint32_t> dropped_{0};
};
