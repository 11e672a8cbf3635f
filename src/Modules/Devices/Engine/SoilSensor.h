#pragma once
/**
 * @file SoilSensor.h
 * @brief VH400 soil moisture probe read through an analog pin.
 *
 * The probe output is reported as volts, uncalibrated.
 */

#include "Modules/Devices/Engine/Device.h"
#include "Modules/Devices/Engine/PinDriver.h"

class SoilSensor : public SensorDevice {
public:
    SoilSensor(const char* name, IAnalogPinDriver* pin) : SensorDevice(name), pin_(pin) {}

    ErrorCode begin() override;
    ErrorCode sample(SensorSample& out) override;

    /** @brief Underlying analog source, driven by the simulation in mock mode. */
    IAnalogPinDriver* pin() const { return pin_; }

private:
    IAnalogPinDriver* pin_ = nullptr;
};
