#pragma once
/**
 * @file HardwareDeviceFactory.h
 * @brief Device factory for the real board.
 */

#include <memory>
#include "Modules/Devices/Engine/DeviceFactory.h"
#include "Modules/Devices/Engine/RelayActuator.h"
#include "Modules/Devices/Drivers/Bme280Sensor.h"
#include "Modules/Devices/Drivers/ButtonInput.h"
#include "Modules/Devices/Drivers/Esp32AnalogPin.h"
#include "Modules/Devices/Drivers/GpioDriver.h"
#include "Modules/Devices/Drivers/I2CBus.h"
#include "Modules/Devices/Drivers/LcdDisplay.h"

class HardwareDeviceFactory : public DeviceFactory {
public:
    HardwareDeviceFactory(uint8_t sdaPin, uint8_t sclPin, uint8_t lcdCols, uint8_t lcdRows)
        : sda_(sdaPin), scl_(sclPin), lcdCols_(lcdCols), lcdRows_(lcdRows) {}

    bool isMock() const override { return false; }

    ErrorCode createInput(const char* name, uint8_t pin, InputDevice*& out) override;
    ErrorCode createRelay(const char* name, uint8_t pin, ActuatorDevice*& out) override;
    ErrorCode createEnvSensor(const char* name, uint8_t i2cAddr, SensorDevice*& out) override;
    ErrorCode createDisplay(const char* name, uint8_t i2cAddr, DisplayDevice*& out) override;
    ErrorCode createSoilSensor(const char* name, uint8_t pin, SoilSensor*& out) override;

private:
    static constexpr uint8_t kMaxButtons = 2;

    bool ensureI2c_();

    uint8_t sda_;
    uint8_t scl_;
    uint8_t lcdCols_;
    uint8_t lcdRows_;

    I2CBus i2c_;
    bool i2cStarted_ = false;

    std::unique_ptr<ButtonInput> buttons_[kMaxButtons];
    uint8_t buttonCount_ = 0;
    std::unique_ptr<GpioDriver> relayPin_;
    std::unique_ptr<RelayActuator> relay_;
    std::unique_ptr<Bme280Sensor> env_;
    std::unique_ptr<LcdDisplay> display_;
    std::unique_ptr<Esp32AnalogPin> soilPin_;
    std::unique_ptr<SoilSensor> soil_;
};
