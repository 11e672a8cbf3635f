#pragma once
/**
 * @file IActivity.h
 * @brief Activity host service interface.
 */

#include <stdint.h>

class Activity;

/**
 * @brief Runs each started activity on its own execution context.
 *
 * On target every activity gets a FreeRTOS task; tests step them by hand.
 */
struct ActivityHostService {
    bool (*start)(void* ctx, Activity* activity);
    /** @brief Activities started and not yet finished. */
    uint8_t (*runningCount)(void* ctx);
    void* ctx;
};
