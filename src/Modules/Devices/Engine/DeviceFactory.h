#pragma once
/**
 * @file DeviceFactory.h
 * @brief Constructs the station devices, real or synthetic.
 *
 * Every create call returns ErrorCode::None and a device that the factory
 * owns for the rest of the process, or an error and a null device.
 */

#include <stdint.h>
#include "Core/ErrorCodes.h"
#include "Modules/Devices/Engine/Device.h"
#include "Modules/Devices/Engine/SoilSensor.h"

class DeviceFactory {
public:
    virtual ~DeviceFactory() = default;

    /** @brief True when devices are software-only. */
    virtual bool isMock() const = 0;

    virtual ErrorCode createInput(const char* name, uint8_t pin, InputDevice*& out) = 0;
    virtual ErrorCode createRelay(const char* name, uint8_t pin, ActuatorDevice*& out) = 0;
    virtual ErrorCode createEnvSensor(const char* name, uint8_t i2cAddr, SensorDevice*& out) = 0;
    virtual ErrorCode createDisplay(const char* name, uint8_t i2cAddr, DisplayDevice*& out) = 0;
    virtual ErrorCode createSoilSensor(const char* name, uint8_t pin, SoilSensor*& out) = 0;
};
