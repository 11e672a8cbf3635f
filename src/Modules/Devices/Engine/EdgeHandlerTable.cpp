/**
 * @file EdgeHandlerTable.cpp
 * @brief Implementation file.
 */

#include "EdgeHandlerTable.h"

int8_t EdgeHandlerTable::add(EdgeHandlerFn fn, void* ctx)
{
    if (!fn) return -1;
    for (uint8_t i = 0; i < Limits::MaxEdgeHandlers; ++i) {
        Slot& s = slots_[i];
        if (s.active.load(std::memory_order_acquire)) continue;
        s.fn = fn;
        s.ctx = ctx;
        s.active.store(true, std::memory_order_release);
        return (int8_t)i;
    }
    return -1;
}

bool EdgeHandlerTable::remove(int8_t id)
{
    if (id < 0 || id >= (int8_t)Limits::MaxEdgeHandlers) return false;
    return slots_[id].active.exchange(false, std::memory_order_acq_rel);
}

void EdgeHandlerTable::notify(InputDevice& input, EdgeType edge)
{
    for (uint8_t i = 0; i < Limits::MaxEdgeHandlers; ++i) {
        Slot& s = slots_[i];
        if (!s.active.load(std::memory_order_acquire)) continue;
        s.fn(s.ctx, input, edge);
    }
}

uint8_t EdgeHandlerTable::activeCount() const
{
    uint8_t n = 0;
    for (uint8_t i = 0; i < Limits::MaxEdgeHandlers; ++i) {
        if (slots_[i].active.load(std::memory_order_acquire)) ++n;
    }
    return n;
}
