/**
 * @file SoilSensor.cpp
 * @brief Implementation file.
 */

#include "SoilSensor.h"

ErrorCode SoilSensor::begin()
{
    if (!pin_) return ErrorCode::InvalidArg;
    return pin_->begin() ? ErrorCode::None : ErrorCode::InitFailed;
}

ErrorCode SoilSensor::sample(SensorSample& out)
{
    if (!pin_) return ErrorCode::NotReady;

    float volts = 0.0f;
    if (!pin_->read(volts)) return ErrorCode::IoError;

    out.type = SampleType::Scalar;
    out.value = volts;
    return ErrorCode::None;
}
