#pragma once
/**
 * @file Activity.h
 * @brief Base class for independently scheduled station activities.
 */
#include <stdint.h>
#include "Core/SystemLimits.h"

/**
 * @brief A periodic unit of work run by an ActivityHost.
 *
 * The host calls step() repeatedly from a single context. Returning false
 * ends the activity; the host never calls step() again afterwards.
 */
class Activity {
public:
    /** @brief Virtual destructor. */
    virtual ~Activity() = default;

    /** @brief Name used for the task and in logs. */
    virtual const char* activityName() const = 0;

    /** @brief Run one scheduling step at `nowMs`. */
    virtual bool step(uint32_t nowMs) = 0;

    /** @brief Stack size for the backing task on target. */
    virtual uint16_t stackSize() const { return Limits::Activity::TaskStackSize; }
};
