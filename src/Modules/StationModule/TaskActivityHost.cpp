/**
 * @file TaskActivityHost.cpp
 * @brief Implementation file.
 */

#include "TaskActivityHost.h"
#include <Arduino.h>

#define LOG_TAG "ActHost "
#include "Core/ModuleLog.h"

TaskActivityHost::TaskActivityHost()
{
    svc_.start = &TaskActivityHost::svcStart_;
    svc_.runningCount = &TaskActivityHost::svcRunningCount_;
    svc_.ctx = this;
}

bool TaskActivityHost::svcStart_(void* ctx, Activity* activity)
{
    return static_cast<TaskActivityHost*>(ctx)->start(activity);
}

uint8_t TaskActivityHost::svcRunningCount_(void* ctx)
{
    return static_cast<TaskActivityHost*>(ctx)->runningCount();
}

void TaskActivityHost::taskEntry_(void* arg)
{
    Slot* slot = static_cast<Slot*>(arg);
    while (slot->activity->step(millis())) {
        vTaskDelay(pdMS_TO_TICKS(Limits::Activity::IdleMs));
    }

    LOGD("%s finished", slot->activity->activityName());
    slot->task = nullptr;
    slot->host->running_.fetch_sub(1);
    vTaskDelete(nullptr);
}

bool TaskActivityHost::start(Activity* activity)
{
    if (!activity) return false;
    if (slotCount_ >= Limits::MaxActivities) {
        LOGW("no free slot for %s", activity->activityName());
        return false;
    }

    Slot& slot = slots_[slotCount_];
    slot.host = this;
    slot.activity = activity;

    running_.fetch_add(1);
    if (xTaskCreatePinnedToCore(taskEntry_, activity->activityName(), activity->stackSize(),
                                &slot, 1, &slot.task, 1) != pdPASS) {
        running_.fetch_sub(1);
        slot.activity = nullptr;
        LOGE("task create failed for %s", activity->activityName());
        return false;
    }
    ++slotCount_;
    return true;
}
