/**
 * @file SoilSimulator.cpp
 * @brief Implementation file.
 */

#include "SoilSimulator.h"

#define LOG_TAG "SoilSimu"
#include "Core/ModuleLog.h"

bool SimulationJob::configure(IAnalogPinDriver* pin, uint32_t intervalMs, float delta,
                              const ShutdownSignal* shutdown)
{
    if (!pin || intervalMs == 0 || !shutdown) return false;
    pin_ = pin;
    intervalMs_ = intervalMs;
    delta_ = delta;
    shutdown_ = shutdown;
    anchored_ = false;
    ticks_.store(0);
    running_.store(true);
    return true;
}

bool SimulationJob::step(uint32_t nowMs)
{
    if (shutdown_->isSet()) {
        running_.store(false);
        LOGD("simulation of %s stopped after %lu ticks", pin_->id(), (unsigned long)ticks_.load());
        return false;
    }

    if (!anchored_) {
        anchored_ = true;
        lastRunMs_ = nowMs;
        return true;
    }

    if ((uint32_t)(nowMs - lastRunMs_) < intervalMs_) return true;
    lastRunMs_ = nowMs;

    float v = 0.0f;
    if (!pin_->read(v)) {
        LOGW("%s synthetic read failed", pin_->id());
        return true;
    }
    v += delta_;
    if (!pin_->write(v)) {
        LOGW("%s synthetic write failed", pin_->id());
        return true;
    }
    ticks_.fetch_add(1);
    LOGD("%s synthetic value %.2f", pin_->id(), (double)v);
    return true;
}

ErrorCode SoilSimulator::startSimulation(IAnalogPinDriver* pin, uint32_t intervalMs, float delta)
{
    if (!pin || intervalMs == 0) return ErrorCode::InvalidArg;
    if (shutdown_.isSet()) return ErrorCode::NotReady;

    for (uint8_t i = 0; i < count_; ++i) {
        if (jobs_[i].pin() == pin && jobs_[i].isRunning()) {
            LOGW("%s already simulated", pin->id());
            return ErrorCode::Busy;
        }
    }
    if (count_ >= Limits::MaxSimulations) return ErrorCode::Full;

    SimulationJob& job = jobs_[count_];
    if (!job.configure(pin, intervalMs, delta, &shutdown_)) return ErrorCode::InvalidArg;
    if (!host_.start || !host_.start(host_.ctx, &job)) {
        LOGE("%s simulation start failed", pin->id());
        return ErrorCode::Failed;
    }
    ++count_;
    LOGI("simulating %s: %+.3f every %lu ms", pin->id(), (double)delta, (unsigned long)intervalMs);
    return ErrorCode::None;
}
