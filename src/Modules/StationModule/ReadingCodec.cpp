/**
 * @file ReadingCodec.cpp
 * @brief Implementation file.
 */

#include "ReadingCodec.h"
#include <ArduinoJson.h>
#include <math.h>
#include "Core/SystemLimits.h"

#define LOG_TAG "RdgCodec"
#include "Core/ModuleLog.h"

ErrorCode encodeFixed2(const SensorSample& sample, char* out, size_t outLen, size_t& written)
{
    written = 0;
    if (!out || outLen == 0) return ErrorCode::InvalidArg;
    if (sample.type != SampleType::Scalar) return ErrorCode::EncodeFailed;
    if (!isfinite(sample.value)) return ErrorCode::EncodeFailed;

    const int n = snprintf(out, outLen, "%5.2f", (double)sample.value);
    if (n <= 0 || (size_t)n >= outLen) return ErrorCode::EncodeFailed;
    written = (size_t)n;
    return ErrorCode::None;
}

ErrorCode encodeEnvJson(const SensorSample& sample, char* out, size_t outLen, size_t& written)
{
    written = 0;
    if (!out || outLen == 0) return ErrorCode::InvalidArg;
    if (sample.type != SampleType::Environment) return ErrorCode::EncodeFailed;

    const EnvReading& r = sample.env;
    if (!isfinite(r.temperatureC) || !isfinite(r.humidityPct) || !isfinite(r.pressureHpa)) {
        return ErrorCode::EncodeFailed;
    }

    StaticJsonDocument<Limits::JsonEnvBuf> doc;
    doc["temperature"] = r.temperatureC;
    doc["humidity"] = r.humidityPct;
    doc["pressure"] = r.pressureHpa;
    if (doc.overflowed()) return ErrorCode::EncodeFailed;

    if (measureJson(doc) >= outLen) return ErrorCode::EncodeFailed;
    written = serializeJson(doc, out, outLen);
    if (written == 0) return ErrorCode::EncodeFailed;
    return ErrorCode::None;
}
