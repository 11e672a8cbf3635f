#pragma once
/**
 * @file MockDeviceFactory.h
 * @brief Device factory for mock mode.
 */

#include <memory>
#include "Core/SystemLimits.h"
#include "Modules/Devices/Engine/DeviceFactory.h"
#include "Modules/Devices/Engine/RelayActuator.h"
#include "Modules/Devices/Mock/MockDevices.h"

class MockDeviceFactory : public DeviceFactory {
public:
    MockDeviceFactory();

    bool isMock() const override { return true; }

    ErrorCode createInput(const char* name, uint8_t pin, InputDevice*& out) override;
    ErrorCode createRelay(const char* name, uint8_t pin, ActuatorDevice*& out) override;
    ErrorCode createEnvSensor(const char* name, uint8_t i2cAddr, SensorDevice*& out) override;
    ErrorCode createDisplay(const char* name, uint8_t i2cAddr, DisplayDevice*& out) override;
    ErrorCode createSoilSensor(const char* name, uint8_t pin, SoilSensor*& out) override;

    /** @brief Created button by name, so callers can inject edges. */
    MockButton* button(const char* name) const;
    SyntheticDigitalPin* relayPin() const { return relayPin_.get(); }
    SyntheticAnalogPin* soilPin() const { return soilPin_.get(); }
    MockDisplay* display() const { return display_.get(); }

    void setInitialSoilVolts(float v) { soilStart_ = v; }
    void setEnvReading(const EnvReading& r) { envReading_ = r; }

private:
    static constexpr uint8_t kMaxButtons = 2;

    std::unique_ptr<MockButton> buttons_[kMaxButtons];
    uint8_t buttonCount_ = 0;
    std::unique_ptr<SyntheticDigitalPin> relayPin_;
    std::unique_ptr<RelayActuator> relay_;
    std::unique_ptr<MockEnvSensor> env_;
    std::unique_ptr<MockDisplay> display_;
    std::unique_ptr<SyntheticAnalogPin> soilPin_;
    std::unique_ptr<SoilSensor> soil_;

    float soilStart_;
    EnvReading envReading_{};
};
