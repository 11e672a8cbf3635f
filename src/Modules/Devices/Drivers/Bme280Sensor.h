#pragma once
/**
 * @file Bme280Sensor.h
 * @brief BME280 temperature, humidity and pressure sensor.
 */

#include <Adafruit_BME280.h>
#include "Modules/Devices/Engine/Device.h"
#include "Modules/Devices/Drivers/I2CBus.h"

class Bme280Sensor : public SensorDevice {
public:
    Bme280Sensor(const char* name, I2CBus& bus, uint8_t addr) : SensorDevice(name), bus_(bus), addr_(addr) {}

    ErrorCode begin() override;
    ErrorCode sample(SensorSample& out) override;

private:
    I2CBus& bus_;
    uint8_t addr_ = 0x76;
    Adafruit_BME280 bme_;
    bool ready_ = false;
};
