/**
 * @file Bme280Sensor.cpp
 * @brief Implementation file.
 */

#include "Bme280Sensor.h"
#include <math.h>

static constexpr uint32_t kI2cLockMs = 200;

ErrorCode Bme280Sensor::begin()
{
    I2CLock guard(bus_, kI2cLockMs);
    if (!guard.held()) return ErrorCode::Busy;
    if (!bme_.begin(addr_, bus_.wire())) return ErrorCode::InitFailed;
    ready_ = true;
    return ErrorCode::None;
}

ErrorCode Bme280Sensor::sample(SensorSample& out)
{
    if (!ready_) return ErrorCode::NotReady;

    float t = NAN;
    float h = NAN;
    float p = NAN;
    {
        I2CLock guard(bus_, kI2cLockMs);
        if (!guard.held()) return ErrorCode::Busy;
        t = bme_.readTemperature();
        h = bme_.readHumidity();
        p = bme_.readPressure();
    }

    if (isnan(t) || isnan(h) || isnan(p)) return ErrorCode::IoError;

    out.type = SampleType::Environment;
    out.value = t;
    out.env.temperatureC = t;
    out.env.humidityPct = h;
    out.env.pressureHpa = p / 100.0f;
    return ErrorCode::None;
}
