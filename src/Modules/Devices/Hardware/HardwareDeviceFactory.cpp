/**
 * @file HardwareDeviceFactory.cpp
 * @brief Implementation file.
 */

#include "HardwareDeviceFactory.h"

bool HardwareDeviceFactory::ensureI2c_()
{
    if (!i2cStarted_) i2cStarted_ = i2c_.begin(sda_, scl_);
    return i2cStarted_;
}

ErrorCode HardwareDeviceFactory::createInput(const char* name, uint8_t pin, InputDevice*& out)
{
    out = nullptr;
    if (!name) return ErrorCode::InvalidArg;
    if (buttonCount_ >= kMaxButtons) return ErrorCode::Full;

    buttons_[buttonCount_].reset(new ButtonInput(name, pin));
    out = buttons_[buttonCount_++].get();
    return ErrorCode::None;
}

ErrorCode HardwareDeviceFactory::createRelay(const char* name, uint8_t pin, ActuatorDevice*& out)
{
    out = nullptr;
    if (!name) return ErrorCode::InvalidArg;
    if (relay_) return ErrorCode::Busy;

    relayPin_.reset(new GpioDriver(name, pin, true, true));
    relay_.reset(new RelayActuator(name, relayPin_.get()));
    out = relay_.get();
    return ErrorCode::None;
}

ErrorCode HardwareDeviceFactory::createEnvSensor(const char* name, uint8_t i2cAddr, SensorDevice*& out)
{
    out = nullptr;
    if (!name) return ErrorCode::InvalidArg;
    if (env_) return ErrorCode::Busy;
    if (!ensureI2c_()) return ErrorCode::IoError;

    env_.reset(new Bme280Sensor(name, i2c_, i2cAddr));
    out = env_.get();
    return ErrorCode::None;
}

ErrorCode HardwareDeviceFactory::createDisplay(const char* name, uint8_t i2cAddr, DisplayDevice*& out)
{
    out = nullptr;
    if (!name) return ErrorCode::InvalidArg;
    if (display_) return ErrorCode::Busy;
    if (!ensureI2c_()) return ErrorCode::IoError;

    display_.reset(new LcdDisplay(name, i2c_, i2cAddr, lcdCols_, lcdRows_));
    out = display_.get();
    return ErrorCode::None;
}

ErrorCode HardwareDeviceFactory::createSoilSensor(const char* name, uint8_t pin, SoilSensor*& out)
{
    out = nullptr;
    if (!name) return ErrorCode::InvalidArg;
    if (soil_) return ErrorCode::Busy;

    soilPin_.reset(new Esp32AnalogPin(name, pin));
    soil_.reset(new SoilSensor(name, soilPin_.get()));
    out = soil_.get();
    return ErrorCode::None;
}
