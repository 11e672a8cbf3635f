/**
 * @file LcdDisplay.cpp
 * @brief Implementation file.
 */

#include "LcdDisplay.h"
#include "Modules/Devices/Engine/DisplayText.h"

static constexpr uint32_t kI2cLockMs = 200;

LcdDisplay::LcdDisplay(const char* name, I2CBus& bus, uint8_t addr, uint8_t cols, uint8_t rows)
    : DisplayDevice(name), bus_(bus), addr_(addr), cols_(cols), rows_(rows), lcd_(addr, cols, rows)
{
}

ErrorCode LcdDisplay::begin()
{
    // The backpack has no identification register: an ACK is all we can check.
    if (!bus_.probe(addr_)) return ErrorCode::InitFailed;

    I2CLock guard(bus_, kI2cLockMs);
    if (!guard.held()) return ErrorCode::Busy;
    lcd_.init();
    lcd_.backlight();
    ready_ = true;
    return ErrorCode::None;
}

ErrorCode LcdDisplay::clear()
{
    if (!ready_) return ErrorCode::NotReady;
    I2CLock guard(bus_, kI2cLockMs);
    if (!guard.held()) return ErrorCode::Busy;
    lcd_.clear();
    return ErrorCode::None;
}

ErrorCode LcdDisplay::handleMessage(const char* payload, size_t len)
{
    if (!ready_) return ErrorCode::NotReady;

    DisplayText text;
    if (!layoutDisplayText(payload, len, cols_, rows_, text)) return ErrorCode::InvalidArg;

    I2CLock guard(bus_, kI2cLockMs);
    if (!guard.held()) return ErrorCode::Busy;
    lcd_.clear();
    for (uint8_t r = 0; r < text.rows; ++r) {
        lcd_.setCursor(0, r);
        lcd_.print(text.line[r]);
    }
    return ErrorCode::None;
}
