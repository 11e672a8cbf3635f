/**
 * @file CommandRouter.cpp
 * @brief Implementation file.
 */

#include "CommandRouter.h"
#include <string.h>

#define LOG_TAG "CmdRoutr"
#include "Core/ModuleLog.h"

ErrorCode CommandRouter::addRoute(const char* topic, ActuatorDevice* actuator)
{
    if (!actuator) return ErrorCode::InvalidArg;
    return add_(topic, actuator);
}

ErrorCode CommandRouter::addMonitor(const char* topic)
{
    return add_(topic, nullptr);
}

ErrorCode CommandRouter::add_(const char* topic, ActuatorDevice* actuator)
{
    if (!topic || topic[0] == '\0') return ErrorCode::InvalidArg;
    if (strlen(topic) >= Limits::TopicBuf) return ErrorCode::InvalidArg;
    if (route(topic)) return ErrorCode::DuplicateName;
    if (count_ >= Limits::MaxRoutes) return ErrorCode::Full;

    TopicRoute& r = routes_[count_++];
    r.topic = topic;
    r.actuator = actuator;
    r.subscribed = false;
    return ErrorCode::None;
}

const TopicRoute* CommandRouter::route(const char* topic) const
{
    if (!topic) return nullptr;
    for (uint8_t i = 0; i < count_; ++i) {
        if (strcmp(routes_[i].topic, topic) == 0) return &routes_[i];
    }
    return nullptr;
}

bool CommandRouter::subscribeAll(const BusService& bus)
{
    if (!bus.subscribe) return false;
    bus_ = &bus;

    for (uint8_t i = 0; i < count_; ++i) {
        TopicRoute& r = routes_[i];
        if (r.subscribed) continue;
        if (!bus.subscribe(bus.ctx, r.topic, &CommandRouter::onBusMessage, this)) {
            LOGE("subscribe failed topic=%s", r.topic);
            return false;
        }
        r.subscribed = true;
        LOGI("subscribed %s -> %s", r.topic, r.actuator ? r.actuator->name() : "monitor");
    }
    return true;
}

void CommandRouter::unsubscribeAll()
{
    if (!bus_) return;

    for (uint8_t i = 0; i < count_; ++i) {
        TopicRoute& r = routes_[i];
        if (!r.subscribed) continue;
        r.subscribed = false;
        if (!bus_->unsubscribe || !bus_->unsubscribe(bus_->ctx, r.topic)) {
            LOGW("unsubscribe failed topic=%s", r.topic);
        }
    }
}

void CommandRouter::onBusMessage(void* ctx, const char* topic, const char* payload, size_t len)
{
    CommandRouter* self = static_cast<CommandRouter*>(ctx);
    if (!self) return;
    self->dispatch(topic, payload, len);
}

void CommandRouter::dispatch(const char* topic, const char* payload, size_t len)
{
    if (shutdown_.isSet()) {
        dropped_.fetch_add(1);
        LOGD("stopping, dropped %s", topic ? topic : "-");
        return;
    }

    const TopicRoute* r = route(topic);
    if (!r) {
        unknown_.fetch_add(1);
        LOGW("unknown topic %s (%u bytes): %s", topic ? topic : "-", (unsigned)len,
             errorCodeStr(ErrorCode::UnknownTopic));
        return;
    }

    if (!r->actuator) {
        LOGD("observed %s %.*s", r->topic, (int)len, payload ? payload : "");
        return;
    }

    const ErrorCode err = r->actuator->handleMessage(payload, len);
    if (err != ErrorCode::None) {
        failures_.fetch_add(1);
        LOGW("%s -> %s failed: %s", r->topic, r->actuator->name(), errorCodeStr(err));
        return;
    }
    handled_.fetch_add(1);
    LOGI("%s -> %s", r->topic, r->actuator->name());
}
