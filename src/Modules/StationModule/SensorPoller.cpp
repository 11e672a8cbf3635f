/**
 * @file SensorPoller.cpp
 * @brief Implementation file.
 */

#include "SensorPoller.h"
#include <string.h>

#define LOG_TAG "SnsPollr"
#include "Core/ModuleLog.h"

bool PollingJob::configure(SensorDevice* sensor, const char* topic, uint32_t intervalMs,
                           SampleEncodeFn encode, const BusService* bus, const ShutdownSignal* shutdown)
{
    if (!sensor || !topic || topic[0] == '\0' || intervalMs == 0 || !encode || !bus || !shutdown) {
        return false;
    }
    if (strlen(topic) >= sizeof(topic_)) return false;

    sensor_ = sensor;
    strncpy(topic_, topic, sizeof(topic_) - 1);
    topic_[sizeof(topic_) - 1] = '\0';
    intervalMs_ = intervalMs;
    encode_ = encode;
    bus_ = bus;
    shutdown_ = shutdown;
    return true;
}

const char* PollingJob::activityName() const
{
    return sensor_ ? sensor_->name() : "poll";
}

bool PollingJob::shouldExit_() const
{
    return stopped_.load() || (shutdown_ && shutdown_->isSet());
}

bool PollingJob::step(uint32_t nowMs)
{
    if (shouldExit_()) {
        LOGD("%s polling stopped", activityName());
        return false;
    }

    if (!anchored_) {
        anchored_ = true;
        lastRunMs_ = nowMs;
        return true;
    }

    if ((uint32_t)(nowMs - lastRunMs_) < intervalMs_) return true;
    lastRunMs_ = nowMs;

    runCycle_();
    return true;
}

void PollingJob::runCycle_()
{
    cycles_.fetch_add(1);

    SensorSample sample;
    ErrorCode err = sensor_->sample(sample);
    if (err != ErrorCode::None) {
        failures_.fetch_add(1);
        LOGW("%s read failed: %s", sensor_->name(), errorCodeStr(err));
        return;
    }

    char payload[Limits::PayloadBuf];
    size_t len = 0;
    err = encode_(sample, payload, sizeof(payload), len);
    if (err != ErrorCode::None) {
        failures_.fetch_add(1);
        LOGW("%s encode failed: %s", sensor_->name(), errorCodeStr(err));
        return;
    }

    // A read already in flight when shutdown lands completes without publishing.
    if (shouldExit_()) return;

    if (!bus_->publish || !bus_->publish(bus_->ctx, topic_, payload, len)) {
        failures_.fetch_add(1);
        LOGW("%s publish failed topic=%s: %s", sensor_->name(), topic_,
             errorCodeStr(ErrorCode::PublishFailed));
        return;
    }

    published_.fetch_add(1);
    LOGD("%s -> %s %s", sensor_->name(), topic_, payload);
}

PollHandle SensorPoller::startPolling(SensorDevice* sensor, const char* topic, uint32_t intervalMs,
                                      SampleEncodeFn encode, ErrorCode* err)
{
    ErrorCode local = ErrorCode::None;
    PollHandle handle = POLL_HANDLE_INVALID;

    if (shutdown_.isSet()) {
        local = ErrorCode::NotReady;
    } else if (count_ >= Limits::MaxPollers) {
        local = ErrorCode::Full;
    } else {
        for (uint8_t i = 0; i < count_; ++i) {
            if (jobs_[i].sensor() == sensor && !jobs_[i].isStopped()) {
                local = ErrorCode::Busy;
                break;
            }
        }
    }

    if (local == ErrorCode::None) {
        PollingJob& job = jobs_[count_];
        if (!job.configure(sensor, topic, intervalMs, encode, &bus_, &shutdown_)) {
            local = ErrorCode::InvalidArg;
        } else if (!host_.start || !host_.start(host_.ctx, &job)) {
            local = ErrorCode::Failed;
        } else {
            handle = (PollHandle)count_++;
            LOGI("polling %s every %lu ms -> %s", sensor->name(), (unsigned long)intervalMs, topic);
        }
    }

    if (local != ErrorCode::None) {
        LOGE("start polling %s failed: %s", sensor ? sensor->name() : "-", errorCodeStr(local));
    }
    if (err) *err = local;
    return handle;
}

bool SensorPoller::stopPolling(PollHandle handle)
{
    if (handle < 0 || handle >= (PollHandle)count_) return false;
    jobs_[handle].stop();
    return true;
}

void SensorPoller::stopAll()
{
    for (uint8_t i = 0; i < count_; ++i) {
        jobs_[i].stop();
    }
}

const PollingJob* SensorPoller::job(PollHandle handle) const
{
    if (handle < 0 || handle >= (PollHandle)count_) return nullptr;
    return &jobs_[handle];
}

uint32_t SensorPoller::totalPublished() const
{
    uint32_t n = 0;
    for (uint8_t i = 0; i < count_; ++i) n += jobs_[i].published();
    return n;
}

uint32_t SensorPoller::totalFailures() const
{
    uint32_t n = 0;
    for (uint8_t i = 0; i < count_; ++i) n += jobs_[i].failures();
    return n;
}
