#pragma once
/**
 * @file EdgeDispatcher.h
 * @brief Publishes one message per rising edge of an input device.
 */

#include <atomic>
#include <stdint.h>
#include "Core/ShutdownSignal.h"
#include "Core/SystemLimits.h"
#include "Core/Services/IBus.h"
#include "Modules/Devices/Engine/Device.h"

/** @brief Explicit handle on an edge subscription. */
struct EdgeSubscription {
    InputDevice* input = nullptr;
    int8_t handlerId = -1;
};

class EdgeDispatcher {
public:
    EdgeDispatcher(const BusService& bus, const ShutdownSignal& shutdown)
        : bus_(bus), shutdown_(shutdown) {}

    /**
     * @brief Publish `payload` on `topic` for every rising edge of `input`.
     * Falling edges are ignored. No debouncing or coalescing is applied.
     */
    ErrorCode attach(InputDevice* input, const char* topic, const char* payload,
                     EdgeSubscription* out = nullptr);

    /** @brief Unregister every subscription. Late edges publish nothing. */
    void detachAll();

    uint8_t count() const { return count_; }
    uint32_t published() const { return published_.load(); }
    uint32_t failures() const { return failures_.load(); }

private:
    struct Binding {
        EdgeDispatcher* owner = nullptr;
        EdgeSubscription sub{};
        char topic[Limits::TopicBuf] = {0};
        const char* payload = nullptr;
        size_t payloadLen = 0;
        std::atomic<bool> active{false};
    };

    static void onEdgeStatic_(void* ctx, InputDevice& input, EdgeType edge);
    void onEdge_(Binding& b, EdgeType edge);

    const BusService& bus_;
    const ShutdownSignal& shutdown_;

    Binding bindings_[Limits::MaxEdgeBindings];
    uint8_t count_ = 0;
    std::atomic<uint32_t> published_{0};
    std::atomic<uint32_t> failures_{0};
};
