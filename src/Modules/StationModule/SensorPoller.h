#pragma once
/**
 * @file SensorPoller.h
 * @brief Periodic read-and-publish jobs, one activity per monitored sensor.
 */

#include <atomic>
#include <stdint.h>
#include "Core/Activity.h"
#include "Core/ShutdownSignal.h"
#include "Core/SystemLimits.h"
#include "Core/Services/IActivity.h"
#include "Core/Services/IBus.h"
#include "Modules/Devices/Engine/Device.h"
#include "Modules/StationModule/ReadingCodec.h"

/** @brief Handle returned by SensorPoller::startPolling. */
typedef int8_t PollHandle;
constexpr PollHandle POLL_HANDLE_INVALID = -1;

/**
 * @brief One polling job. Cycles are serialized on the job's own activity,
 * so a device never has more than one read in flight.
 */
class PollingJob : public Activity {
public:
    bool configure(SensorDevice* sensor, const char* topic, uint32_t intervalMs,
                   SampleEncodeFn encode, const BusService* bus, const ShutdownSignal* shutdown);

    const char* activityName() const override;
    bool step(uint32_t nowMs) override;

    /** @brief No read starts after this returns. */
    void stop() { stopped_.store(true); }
    bool isStopped() const { return stopped_.load(); }

    SensorDevice* sensor() const { return sensor_; }
    const char* topic() const { return topic_; }
    uint32_t intervalMs() const { return intervalMs_; }
    uint32_t cycles() const { return cycles_.load(); }
    uint32_t published() const { return published_.load(); }
    uint32_t failures() const { return failures_.load(); }

private:
    bool shouldExit_() const;
    void runCycle_();

    SensorDevice* sensor_ = nullptr;
    char topic_[Limits::TopicBuf] = {0};
    uint32_t intervalMs_ = 0;
    SampleEncodeFn encode_ = nullptr;
    const BusService* bus_ = nullptr;
    const ShutdownSignal* shutdown_ = nullptr;

    bool anchored_ = false;
    uint32_t lastRunMs_ = 0;

    std::atomic<bool> stopped_{false};
    std::atomic<uint32_t> cycles_{0};
    std::atomic<uint32_t> published_{0};
    std::atomic<uint32_t> failures_{0};
};

class SensorPoller {
public:
    SensorPoller(const BusService& bus, const ActivityHostService& host, const ShutdownSignal& shutdown)
        : bus_(bus), host_(host), shutdown_(shutdown) {}

    /**
     * @brief Start an independent schedule for `sensor`, publishing to `topic`.
     * The first cycle runs one interval after the job starts.
     */
    PollHandle startPolling(SensorDevice* sensor, const char* topic, uint32_t intervalMs,
                            SampleEncodeFn encode, ErrorCode* err = nullptr);

    /** @brief Cancel one job. No new read starts once this returns. */
    bool stopPolling(PollHandle handle);
    void stopAll();

    uint8_t count() const { return count_; }
    const PollingJob* job(PollHandle handle) const;

    uint32_t totalPublished() const;
    uint32_t totalFailures() const;

private:
    const BusService& bus_;
    const ActivityHostService& host_;
    const ShutdownSignal& shutdown_;

    PollingJob jobs_[Limits::MaxPollers];
    uint8_t count_ = 0;
};
