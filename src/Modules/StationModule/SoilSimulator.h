#pragma once
/**
 * @file SoilSimulator.h
 * @brief Mock mode drift of a synthetic analog value.
 */

#include <atomic>
#include <stdint.h>
#include "Core/Activity.h"
#include "Core/ShutdownSignal.h"
#include "Core/SystemLimits.h"
#include "Core/Services/IActivity.h"
#include "Core/ErrorCodes.h"
#include "Modules/Devices/Engine/PinDriver.h"

/** @brief Adds `delta` to the pin value every `intervalMs` until shutdown. */
class SimulationJob : public Activity {
public:
    bool configure(IAnalogPinDriver* pin, uint32_t intervalMs, float delta, const ShutdownSignal* shutdown);

    const char* activityName() const override { return "simulate"; }
    bool step(uint32_t nowMs) override;

    IAnalogPinDriver* pin() const { return pin_; }
    bool isRunning() const { return running_.load(); }
    uint32_t ticks() const { return ticks_.load(); }

private:
    IAnalogPinDriver* pin_ = nullptr;
    uint32_t intervalMs_ = 0;
    float delta_ = 0.0f;
    const ShutdownSignal* shutdown_ = nullptr;

    bool anchored_ = false;
    uint32_t lastRunMs_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<uint32_t> ticks_{0};
};

class SoilSimulator {
public:
    SoilSimulator(const ActivityHostService& host, const ShutdownSignal& shutdown)
        : host_(host), shutdown_(shutdown) {}

    /** @brief Start drifting `pin`. Busy when that pin is already simulated. */
    ErrorCode startSimulation(IAnalogPinDriver* pin, uint32_t intervalMs, float delta);

    uint8_t count() const { return count_; }
    const SimulationJob* job(uint8_t i) const { return (i < count_) ? &jobs_[i] : nullptr; }

private:
    const ActivityHostService& host_;
    const ShutdownSignal& shutdown_;

    SimulationJob jobs_[Limits::MaxSimulations];
    uint8_t count_ = 0;
};
