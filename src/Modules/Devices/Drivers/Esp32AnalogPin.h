#pragma once
/**
 * @file Esp32AnalogPin.h
 * @brief ESP32 ADC input reported in volts.
 */

#include <stdint.h>
#include "Modules/Devices/Engine/PinDriver.h"

class Esp32AnalogPin : public IAnalogPinDriver {
public:
    Esp32AnalogPin(const char* driverId, uint8_t pin) : driverId_(driverId), pin_(pin) {}

    const char* id() const override { return driverId_; }
    bool begin() override;

    /** @brief Calibrated reading from analogReadMilliVolts. */
    bool read(float& volts) const override;
    /** @brief ADC pins are input only. */
    bool write(float) override { return false; }

private:
    const char* driverId_ = nullptr;
    uint8_t pin_ = 0;
    bool ready_ = false;
};
