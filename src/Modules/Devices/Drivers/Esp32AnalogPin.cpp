/**
 * @file Esp32AnalogPin.cpp
 * @brief Implementation file.
 */

#include "Esp32AnalogPin.h"
#include <Arduino.h>

bool Esp32AnalogPin::begin()
{
    if (digitalPinToAnalogChannel(pin_) < 0) return false;
    analogSetPinAttenuation(pin_, ADC_11db);
    pinMode(pin_, INPUT);
    ready_ = true;
    return true;
}

bool Esp32AnalogPin::read(float& volts) const
{
    if (!ready_) return false;
    uint32_t mv = analogReadMilliVolts(pin_);
    volts = (float)mv / 1000.0f;
    return true;
}
