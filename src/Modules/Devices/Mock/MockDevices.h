#pragma once
/**
 * @file MockDevices.h
 * @brief Software-only devices used in mock mode.
 */

#include <atomic>
#include <mutex>
#include "Modules/Devices/Engine/Device.h"
#include "Modules/Devices/Engine/DisplayText.h"
#include "Modules/Devices/Engine/EdgeHandlerTable.h"
#include "Modules/Devices/Engine/PinDriver.h"

/** @brief Analog pin holding a synthetic voltage. */
class SyntheticAnalogPin : public IAnalogPinDriver {
public:
    SyntheticAnalogPin(const char* id, float initial) : id_(id), volts_(initial) {}

    const char* id() const override { return id_; }
    bool begin() override { return true; }
    bool read(float& volts) const override;
    bool write(float volts) override;

private:
    const char* id_ = nullptr;
    std::atomic<float> volts_;
};

/** @brief Digital output that only remembers its level. */
class SyntheticDigitalPin : public IDigitalPinDriver {
public:
    explicit SyntheticDigitalPin(const char* id) : id_(id) {}

    const char* id() const override { return id_; }
    bool begin() override { return true; }
    bool write(bool on) override;
    bool read(bool& on) const override;

    uint32_t writeCount() const { return writes_.load(); }

private:
    const char* id_ = nullptr;
    std::atomic<bool> level_{false};
    std::atomic<uint32_t> writes_{0};
};

/** @brief Environmental sensor returning a fixed reading. */
class MockEnvSensor : public SensorDevice {
public:
    MockEnvSensor(const char* name, const EnvReading& reading) : SensorDevice(name), reading_(reading) {}

    ErrorCode begin() override { return ErrorCode::None; }
    ErrorCode sample(SensorSample& out) override;

private:
    EnvReading reading_{};
};

/** @brief Display keeping the rendered text in memory. */
class MockDisplay : public DisplayDevice {
public:
    MockDisplay(const char* name, uint8_t cols, uint8_t rows);

    ErrorCode begin() override;
    ErrorCode clear() override;
    ErrorCode handleMessage(const char* payload, size_t len) override;

    /** @brief Copy of one rendered row (empty string when out of range). */
    bool line(uint8_t row, char* out, size_t outLen) const;
    uint32_t clearCount() const { return clears_; }

private:
    uint8_t cols_ = 16;
    uint8_t rows_ = 2;
    mutable std::mutex mutex_;
    DisplayText text_{};
    uint32_t clears_ = 0;
};

/** @brief Input that only fires on injected edges. */
class MockButton : public InputDevice {
public:
    explicit MockButton(const char* name) : InputDevice(name) {}

    ErrorCode begin() override { return ErrorCode::None; }
    int8_t registerEdgeHandler(EdgeHandlerFn fn, void* ctx) override { return handlers_.add(fn, ctx); }
    bool unregisterEdgeHandler(int8_t id) override { return handlers_.remove(id); }

    /** @brief Deliver one edge synchronously on the caller's context. */
    void inject(EdgeType edge) { handlers_.notify(*this, edge); }
    uint8_t handlerCount() const { return handlers_.activeCount(); }

private:
    EdgeHandlerTable handlers_;
};
