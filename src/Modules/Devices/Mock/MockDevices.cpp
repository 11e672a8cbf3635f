/**
 * @file MockDevices.cpp
 * @brief Implementation file.
 */

#include "MockDevices.h"
#include <string.h>

bool SyntheticAnalogPin::read(float& volts) const
{
    volts = volts_.load();
    return true;
}

bool SyntheticAnalogPin::write(float volts)
{
    volts_.store(volts);
    return true;
}

bool SyntheticDigitalPin::write(bool on)
{
    level_.store(on);
    writes_.fetch_add(1);
    return true;
}

bool SyntheticDigitalPin::read(bool& on) const
{
    on = level_.load();
    return true;
}

ErrorCode MockEnvSensor::sample(SensorSample& out)
{
    out.type = SampleType::Environment;
    out.env = reading_;
    return ErrorCode::None;
}

MockDisplay::MockDisplay(const char* name, uint8_t cols, uint8_t rows)
    : DisplayDevice(name), cols_(cols), rows_(rows)
{
}

ErrorCode MockDisplay::begin()
{
    if (cols_ == 0 || rows_ == 0) return ErrorCode::InvalidArg;
    if (cols_ > DISPLAY_TEXT_MAX_COLS || rows_ > DISPLAY_TEXT_MAX_ROWS) return ErrorCode::InvalidArg;
    return ErrorCode::None;
}

ErrorCode MockDisplay::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    text_ = DisplayText{};
    ++clears_;
    return ErrorCode::None;
}

ErrorCode MockDisplay::handleMessage(const char* payload, size_t len)
{
    DisplayText next;
    if (!layoutDisplayText(payload, len, cols_, rows_, next)) return ErrorCode::InvalidArg;

    std::lock_guard<std::mutex> lock(mutex_);
    text_ = next;
    return ErrorCode::None;
}

bool MockDisplay::line(uint8_t row, char* out, size_t outLen) const
{
    if (!out || outLen == 0) return false;
    out[0] = '\0';

    std::lock_guard<std::mutex> lock(mutex_);
    if (row >= text_.rows) return false;
    strncpy(out, text_.line[row], outLen - 1);
    out[outLen - 1] = '\0';
    return true;
}
