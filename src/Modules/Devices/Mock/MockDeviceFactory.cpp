/**
 * @file MockDeviceFactory.cpp
 * @brief Implementation file.
 */

#include "MockDeviceFactory.h"
#include <string.h>
#include "Domain/StationDefaults.h"

MockDeviceFactory::MockDeviceFactory()
    : soilStart_(StationDefaults::SimulationStart)
{
    envReading_.temperatureC = StationDefaults::MockTemperatureC;
    envReading_.humidityPct = StationDefaults::MockHumidityPct;
    envReading_.pressureHpa = StationDefaults::MockPressureHpa;
}

ErrorCode MockDeviceFactory::createInput(const char* name, uint8_t, InputDevice*& out)
{
    out = nullptr;
    if (!name) return ErrorCode::InvalidArg;
    if (buttonCount_ >= kMaxButtons) return ErrorCode::Full;

    buttons_[buttonCount_].reset(new MockButton(name));
    out = buttons_[buttonCount_++].get();
    return ErrorCode::None;
}

ErrorCode MockDeviceFactory::createRelay(const char* name, uint8_t, ActuatorDevice*& out)
{
    out = nullptr;
    if (!name) return ErrorCode::InvalidArg;
    if (relay_) return ErrorCode::Busy;

    relayPin_.reset(new SyntheticDigitalPin(name));
    relay_.reset(new RelayActuator(name, relayPin_.get()));
    out = relay_.get();
    return ErrorCode::None;
}

ErrorCode MockDeviceFactory::createEnvSensor(const char* name, uint8_t, SensorDevice*& out)
{
    out = nullptr;
    if (!name) return ErrorCode::InvalidArg;
    if (env_) return ErrorCode::Busy;

    env_.reset(new MockEnvSensor(name, envReading_));
    out = env_.get();
    return ErrorCode::None;
}

ErrorCode MockDeviceFactory::createDisplay(const char* name, uint8_t, DisplayDevice*& out)
{
    out = nullptr;
    if (!name) return ErrorCode::InvalidArg;
    if (display_) return ErrorCode::Busy;

    display_.reset(new MockDisplay(name, StationDefaults::LcdCols, StationDefaults::LcdRows));
    out = display_.get();
    return ErrorCode::None;
}

ErrorCode MockDeviceFactory::createSoilSensor(const char* name, uint8_t, SoilSensor*& out)
{
    out = nullptr;
    if (!name) return ErrorCode::InvalidArg;
    if (soil_) return ErrorCode::Busy;

    soilPin_.reset(new SyntheticAnalogPin(name, soilStart_));
    soil_.reset(new SoilSensor(name, soilPin_.get()));
    out = soil_.get();
    return ErrorCode::None;
}

MockButton* MockDeviceFactory::button(const char* name) const
{
    if (!name) return nullptr;
    for (uint8_t i = 0; i < buttonCount_; ++i) {
        if (buttons_[i] && strcmp(buttons_[i]->name(), name) == 0) return buttons_[i].get();
    }
    return nullptr;
}
