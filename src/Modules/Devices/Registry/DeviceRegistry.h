#pragma once
/**
 * @file DeviceRegistry.h
 * @brief Static name -> device table.
 *
 * Populated during station init only. Lookups afterwards need no locking.
 */

#include <stdint.h>
#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include "Modules/Devices/Engine/Device.h"

class DeviceRegistry {
public:
    /** @brief Register a device under its name. Fails with DuplicateName when taken. */
    ErrorCode add(Device* device);

    /** @brief Fetch a device by name. Fails with NotFound when never added. */
    ErrorCode get(const char* name, Device*& out) const;

    Device* find(const char* name) const;

    uint8_t count() const { return count_; }
    Device* at(uint8_t i) const;

private:
    Device* devices_[Limits::MaxDevices] = {nullptr};
    uint8_t count_ = 0;
};
