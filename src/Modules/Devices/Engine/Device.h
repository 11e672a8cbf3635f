#pragma once
/**
 * @file Device.h
 * @brief Device handles exposed to the station core.
 *
 * A device is a named capability (sensor, actuator, display or input) backed
 * by an opaque driver. Devices are created once during station init and live
 * for the process lifetime.
 */

#include <stddef.h>
#include <stdint.h>
#include "Core/ErrorCodes.h"

enum class DeviceKind : uint8_t {
    Sensor = 0,
    Actuator,
    Display,
    Input
};

static inline const char* deviceKindStr(DeviceKind kind)
{
    switch (kind) {
    case DeviceKind::Sensor: return "sensor";
    case DeviceKind::Actuator: return "actuator";
    case DeviceKind::Display: return "display";
    case DeviceKind::Input: return "input";
    default: return "unknown";
    }
}

class Device {
public:
    Device(const char* name, DeviceKind kind) : name_(name), kind_(kind) {}
    virtual ~Device() = default;

    const char* name() const { return name_; }
    DeviceKind kind() const { return kind_; }

    /** @brief Bring the underlying driver up. Called once by the station. */
    virtual ErrorCode begin() = 0;

private:
    const char* name_ = nullptr;
    DeviceKind kind_ = DeviceKind::Sensor;
};

// ---------------------------------------------------------------- Sensors

enum class SampleType : uint8_t {
    Scalar = 0,
    Environment
};

struct EnvReading {
    float temperatureC = 0.0f;
    float humidityPct = 0.0f;
    float pressureHpa = 0.0f;
};

struct SensorSample {
    SampleType type = SampleType::Scalar;
    float value = 0.0f;
    EnvReading env{};
};

class SensorDevice : public Device {
public:
    explicit SensorDevice(const char* name) : Device(name, DeviceKind::Sensor) {}
    virtual ErrorCode sample(SensorSample& out) = 0;
};

// -------------------------------------------------------------- Actuators

class ActuatorDevice : public Device {
public:
    explicit ActuatorDevice(const char* name, DeviceKind kind = DeviceKind::Actuator)
        : Device(name, kind) {}

    /** @brief Apply an inbound command payload. The payload is not NUL terminated. */
    virtual ErrorCode handleMessage(const char* payload, size_t len) = 0;
};

class DisplayDevice : public ActuatorDevice {
public:
    explicit DisplayDevice(const char* name) : ActuatorDevice(name, DeviceKind::Display) {}
    virtual ErrorCode clear() = 0;
};

// ----------------------------------------------------------------- Inputs

enum class EdgeType : uint8_t {
    Rising = 0,
    Falling
};

class InputDevice;

typedef void (*EdgeHandlerFn)(void* ctx, InputDevice& input, EdgeType edge);

class InputDevice : public Device {
public:
    explicit InputDevice(const char* name) : Device(name, DeviceKind::Input) {}

    /**
     * @brief Register an edge callback.
     * @return Handler id, or -1 when the driver has no free slot.
     *
     * Callbacks run on the driver's notification context, in the order the
     * hardware reported the edges.
     */
    virtual int8_t registerEdgeHandler(EdgeHandlerFn fn, void* ctx) = 0;
    virtual bool unregisterEdgeHandler(int8_t id) = 0;
};
