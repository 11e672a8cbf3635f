#pragma once
/**
 * @file ReadingCodec.h
 * @brief Sensor sample encoders used by the pollers.
 */

#include <stddef.h>
#include "Core/ErrorCodes.h"
#include "Modules/Devices/Engine/Device.h"

/**
 * @brief Encoder signature: writes a NUL terminated payload into `out`.
 * `written` receives the payload length without terminator.
 */
typedef ErrorCode (*SampleEncodeFn)(const SensorSample& sample, char* out, size_t outLen, size_t& written);

/** @brief Scalar as `%5.2f` text (0.42 -> " 0.42"). */
ErrorCode encodeFixed2(const SensorSample& sample, char* out, size_t outLen, size_t& written);

/** @brief Environment reading as `{"temperature":..,"humidity":..,"pressure":..}`. */
ErrorCode encodeEnvJson(const SensorSample& sample, char* out, size_t outLen, size_t& written);
