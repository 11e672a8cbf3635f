#pragma once
/**
 * @file LcdDisplay.h
 * @brief HD44780 character display behind a PCF8574 I2C backpack.
 */

#include <LiquidCrystal_I2C.h>
#include "Modules/Devices/Engine/Device.h"
#include "Modules/Devices/Drivers/I2CBus.h"

class LcdDisplay : public DisplayDevice {
public:
    LcdDisplay(const char* name, I2CBus& bus, uint8_t addr, uint8_t cols, uint8_t rows);

    ErrorCode begin() override;
    ErrorCode clear() override;
    ErrorCode handleMessage(const char* payload, size_t len) override;

private:
    I2CBus& bus_;
    uint8_t addr_;
    uint8_t cols_;
    uint8_t rows_;
    LiquidCrystal_I2C lcd_;
    bool ready_ = false;
};
