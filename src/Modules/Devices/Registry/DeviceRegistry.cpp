/**
 * @file DeviceRegistry.cpp
 * @brief Implementation file.
 */

#include "DeviceRegistry.h"
#include <string.h>

ErrorCode DeviceRegistry::add(Device* device)
{
    if (!device || !device->name() || device->name()[0] == '\0') return ErrorCode::InvalidArg;
    if (find(device->name())) return ErrorCode::DuplicateName;
    if (count_ >= Limits::MaxDevices) return ErrorCode::Full;
    devices_[count_++] = device;
    return ErrorCode::None;
}

ErrorCode DeviceRegistry::get(const char* name, Device*& out) const
{
    out = nullptr;
    if (!name) return ErrorCode::InvalidArg;
    Device* d = find(name);
    if (!d) return ErrorCode::NotFound;
    out = d;
    return ErrorCode::None;
}

Device* DeviceRegistry::find(const char* name) const
{
    if (!name) return nullptr;

    for (uint8_t i = 0; i < count_; ++i) {
        Device* d = devices_[i];
        if (!d || !d->name()) continue;
        if (strcmp(d->name(), name) == 0) return d;
    }

    return nullptr;
}

Device* DeviceRegistry::at(uint8_t i) const
{
    if (i >= count_) return nullptr;
    return devices_[i];
}
