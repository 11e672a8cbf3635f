#pragma once
/**
 * @file TaskActivityHost.h
 * @brief Runs each station activity on its own FreeRTOS task.
 */

#include <atomic>
#include "Core/Activity.h"
#include "Core/Services/IActivity.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

class TaskActivityHost {
public:
    TaskActivityHost();

    const ActivityHostService& service() const { return svc_; }

    bool start(Activity* activity);
    uint8_t runningCount() const { return running_.load(); }

private:
    struct Slot {
        TaskActivityHost* host = nullptr;
        Activity* activity = nullptr;
        TaskHandle_t task = nullptr;
    };

    static void taskEntry_(void* arg);
    static bool svcStart_(void* ctx, Activity* activity);
    static uint8_t svcRunningCount_(void* ctx);

    ActivityHostService svc_{};
    Slot slots_[Limits::MaxActivities];
    uint8_t slotCount_ = 0;
    std::atomic<uint8_t> running_{0};
};
