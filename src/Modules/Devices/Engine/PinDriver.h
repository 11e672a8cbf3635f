#pragma once
/**
 * @file PinDriver.h
 * @brief Pin-level driver interfaces under the station devices.
 */

#include <stdint.h>

class PinDriver {
public:
    virtual ~PinDriver() = default;
    virtual const char* id() const = 0;
    virtual bool begin() = 0;
};

class IDigitalPinDriver : public PinDriver {
public:
    virtual bool write(bool on) = 0;
    virtual bool read(bool& on) const = 0;
};

/** @brief Analog source in volts. Hardware pins reject write(). */
class IAnalogPinDriver : public PinDriver {
public:
    virtual bool read(float& volts) const = 0;
    virtual bool write(float volts) = 0;
};
