#pragma once
/**
 * @file FakeBus.h
 * @brief In-memory BusService for host tests.
 */

#include <string.h>
#include <string>
#include <vector>
#include "Core/Services/IBus.h"

struct FakeBusMessage {
    std::string topic;
    std::string payload;
};

class FakeBus {
public:
    FakeBus()
    {
        svc_.connect = &FakeBus::connect_;
        svc_.publish = &FakeBus::publish_;
        svc_.subscribe = &FakeBus::subscribe_;
        svc_.unsubscribe = &FakeBus::unsubscribe_;
        svc_.isConnected = &FakeBus::isConnected_;
        svc_.ctx = this;
    }

    const BusService& service() const { return svc_; }

    bool connectResult = true;
    bool publishResult = true;
    bool subscribeResult = true;

    bool connected = false;
    int connectCalls = 0;
    std::vector<FakeBusMessage> published;

    struct Subscription {
        std::string topic;
        BusMessageFn fn;
        void* ctx;
    };
    std::vector<Subscription> subscriptions;

    size_t countOn(const char* topic) const
    {
        size_t n = 0;
        for (const FakeBusMessage& m : published) {
            if (m.topic == topic) ++n;
        }
        return n;
    }

    bool isSubscribed(const char* topic) const
    {
        for (const Subscription& s : subscriptions) {
            if (s.topic == topic) return true;
        }
        return false;
    }

    /** @brief Deliver an inbound message to the matching subscriber. */
    bool deliver(const char* topic, const char* payload)
    {
        for (const Subscription& s : subscriptions) {
            if (s.topic == topic) {
                s.fn(s.ctx, topic, payload, strlen(payload));
                return true;
            }
        }
        return false;
    }

private:
    static bool connect_(void* ctx)
    {
        FakeBus* self = static_cast<FakeBus*>(ctx);
        ++self->connectCalls;
        self->connected = self->connectResult;
        return self->connectResult;
    }

    static bool publish_(void* ctx, const char* topic, const char* payload, size_t len)
    {
        FakeBus* self = static_cast<FakeBus*>(ctx);
        if (!self->publishResult) return false;
        self->published.push_back(FakeBusMessage{topic, std::string(payload, len)});
        return true;
    }

    static bool subscribe_(void* ctx, const char* topic, BusMessageFn fn, void* fnCtx)
    {
        FakeBus* self = static_cast<FakeBus*>(ctx);
        if (!self->subscribeResult) return false;
        self->subscriptions.push_back(Subscription{topic, fn, fnCtx});
        return true;
    }

    static bool unsubscribe_(void* ctx, const char* topic)
    {
        FakeBus* self = static_cast<FakeBus*>(ctx);
        for (size_t i = 0; i < self->subscriptions.size(); ++i) {
            if (self->subscriptions[i].topic == topic) {
                self->subscriptions.erase(self->subscriptions.begin() + (long)i);
                return true;
            }
        }
        return false;
    }

    static bool isConnected_(void* ctx)
    {
        return static_cast<FakeBus*>(ctx)->connected;
    }

    BusService svc_{};
};
