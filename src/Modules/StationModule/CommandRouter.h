#pragma once
/**
 * @file CommandRouter.h
 * @brief Static inbound topic -> actuator routing.
 *
 * Each topic maps to exactly one handler. Monitor routes only log the
 * traffic they observe and never actuate anything.
 */

#include <atomic>
#include <stddef.h>
#include <stdint.h>
#include "Core/ErrorCodes.h"
#include "Core/ShutdownSignal.h"
#include "Core/SystemLimits.h"
#include "Core/Services/IBus.h"
#include "Modules/Devices/Engine/Device.h"

struct TopicRoute {
    const char* topic = nullptr;
    ActuatorDevice* actuator = nullptr;
    bool subscribed = false;
};

class CommandRouter {
public:
    explicit CommandRouter(const ShutdownSignal& shutdown) : shutdown_(shutdown) {}

    /** @brief Bind `topic` to `actuator`. Fails with DuplicateName when already routed. */
    ErrorCode addRoute(const char* topic, ActuatorDevice* actuator);
    /** @brief Bind `topic` to a log-only monitor. */
    ErrorCode addMonitor(const char* topic);

    /** @brief Route lookup. Null when the topic is unmapped. */
    const TopicRoute* route(const char* topic) const;

    /** @brief Subscribe every route on `bus`. Stops at the first refusal. */
    bool subscribeAll(const BusService& bus);
    void unsubscribeAll();

    /**
     * @brief Handle one inbound message. Failures are logged, never propagated.
     * Messages still in flight once the shutdown signal is set are dropped.
     */
    void dispatch(const char* topic, const char* payload, size_t len);

    /** @brief Bus callback trampoline, ctx is the router. */
    static void onBusMessage(void* ctx, const char* topic, const char* payload, size_t len);

    uint8_t count() const { return count_; }
    const TopicRoute* at(uint8_t i) const { return (i < count_) ? &routes_[i] : nullptr; }

    uint32_t handled() const { return handled_.load(); }
    uint32_t failures() const { return failures_.load(); }
    uint32_t unknown() const { return unknown_.load(); }
    uint32_t dropped() const { return dropped_.load(); }

private:
    ErrorCode add_(const char* topic, ActuatorDevice* actuator);

    TopicRoute routes_[Limits::MaxRoutes];
    uint8_t count_ = 0;
    const ShutdownSignal& shutdown_;
    const BusService* bus_ = nullptr;

    std::atomic<uint32_t> handled_{0};
    std::atomic<uint32_t> failures_{0};
    std::atomic<uint32_t> unknown_{0};
    std::atomic<uint32_t> dropped_{0};
};
