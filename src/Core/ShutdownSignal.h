#pragma once
/**
 * @file ShutdownSignal.h
 * @brief Process-wide one-shot shutdown broadcast.
 */
#include <atomic>

class ShutdownSignal {
public:
    /**
     * @brief Deliver the signal.
     * @return true only for the call that actually delivered it.
     */
    bool trigger() { return !set_.exchange(true, std::memory_order_acq_rel); }

    bool isSet() const { return set_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> set_{false};
};
