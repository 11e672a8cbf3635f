#pragma once
/**
 * @file EdgeHandlerTable.h
 * @brief Fixed handler table shared by input drivers.
 */

#include <atomic>
#include <stdint.h>
#include "Core/SystemLimits.h"
#include "Modules/Devices/Engine/Device.h"

class EdgeHandlerTable {
public:
    int8_t add(EdgeHandlerFn fn, void* ctx);
    bool remove(int8_t id);

    /** @brief Invoke every active handler for one edge. */
    void notify(InputDevice& input, EdgeType edge);

    uint8_t activeCount() const;

private:
    struct Slot {
        EdgeHandlerFn fn = nullptr;
        void* ctx = nullptr;
        std::atomic<bool> active{false};
    };

    Slot slots_[Limits::MaxEdgeHandlers];
};
