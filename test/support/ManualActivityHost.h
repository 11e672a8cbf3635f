#pragma once
/**
 * @file ManualActivityHost.h
 * @brief ActivityHostService stepped explicitly by host tests.
 */

#include <stdint.h>
#include <vector>
#include "Core/Activity.h"
#include "Core/Services/IActivity.h"

class ManualActivityHost {
public:
    ManualActivityHost()
    {
        svc_.start = &ManualActivityHost::start_;
        svc_.runningCount = &ManualActivityHost::runningCount_;
        svc_.ctx = this;
    }

    const ActivityHostService& service() const { return svc_; }

    bool acceptStart = true;

    /** @brief Step every running activity once at `nowMs`. */
    void stepAll(uint32_t nowMs)
    {
        for (Entry& e : entries_) {
            if (!e.running) continue;
            if (!e.activity->step(nowMs)) e.running = false;
        }
        nowMs_ = nowMs;
    }

    /** @brief Advance time to `untilMs`, stepping every `stepMs`. */
    void runUntil(uint32_t untilMs, uint32_t stepMs = 100)
    {
        uint32_t t = nowMs_;
        while (t < untilMs) {
            t += stepMs;
            if (t > untilMs) t = untilMs;
            stepAll(t);
        }
    }

    uint32_t now() const { return nowMs_; }
    size_t started() const { return entries_.size(); }

    uint8_t running() const
    {
        uint8_t n = 0;
        for (const Entry& e : entries_) {
            if (e.running) ++n;
        }
        return n;
    }

private:
    struct Entry {
        Activity* activity;
        bool running;
    };

    static bool start_(void* ctx, Activity* activity)
    {
        ManualActivityHost* self = static_cast<ManualActivityHost*>(ctx);
        if (!self->acceptStart || !activity) return false;
        self->entries_.push_back(Entry{activity, true});
        // Anchor the activity at the current time like a freshly created task.
        self->entries_.back().running = activity->step(self->nowMs_);
        return true;
    }

    static uint8_t runningCount_(void* ctx)
    {
        return static_cast<ManualActivityHost*>(ctx)->running();
    }

    ActivityHostService svc_{};
    std::vector<Entry> entries_;
    uint32_t nowMs_ = 0;
};
