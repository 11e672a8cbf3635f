/**
 * @file EdgeDispatcher.cpp
 * @brief Implementation file.
 */

#include "EdgeDispatcher.h"
#include <string.h>

#define LOG_TAG "EdgeDisp"
#include "Core/ModuleLog.h"

ErrorCode EdgeDispatcher::attach(InputDevice* input, const char* topic, const char* payload,
                                 EdgeSubscription* out)
{
    if (!input || !topic || topic[0] == '\0' || !payload) return ErrorCode::InvalidArg;
    if (shutdown_.isSet()) return ErrorCode::NotReady;
    if (count_ >= Limits::MaxEdgeBindings) return ErrorCode::Full;
    if (strlen(topic) >= Limits::TopicBuf) return ErrorCode::InvalidArg;

    Binding& b = bindings_[count_];
    b.owner = this;
    strncpy(b.topic, topic, sizeof(b.topic) - 1);
    b.topic[sizeof(b.topic) - 1] = '\0';
    b.payload = payload;
    b.payloadLen = strlen(payload);
    b.sub.input = input;
    b.active.store(true);

    const int8_t id = input->registerEdgeHandler(&EdgeDispatcher::onEdgeStatic_, &b);
    if (id < 0) {
        b.active.store(false);
        LOGE("%s: no edge handler slot", input->name());
        return ErrorCode::Full;
    }
    b.sub.handlerId = id;
    ++count_;

    if (out) *out = b.sub;
    LOGI("%s rising edge -> %s", input->name(), topic);
    return ErrorCode::None;
}

void EdgeDispatcher::detachAll()
{
    for (uint8_t i = 0; i < count_; ++i) {
        Binding& b = bindings_[i];
        if (!b.active.exchange(false)) continue;
        if (b.sub.input && !b.sub.input->unregisterEdgeHandler(b.sub.handlerId)) {
            LOGW("%s: edge handler %d already gone", b.sub.input->name(), (int)b.sub.handlerId);
        }
    }
}

void EdgeDispatcher::onEdgeStatic_(void* ctx, InputDevice&, EdgeType edge)
{
    Binding* b = static_cast<Binding*>(ctx);
    if (!b || !b->owner) return;
    b->owner->onEdge_(*b, edge);
}

void EdgeDispatcher::onEdge_(Binding& b, EdgeType edge)
{
    if (edge != EdgeType::Rising) return;
    if (!b.active.load() || shutdown_.isSet()) return;

    const char* name = b.sub.input ? b.sub.input->name() : "-";
    if (!bus_.publish || !bus_.publish(bus_.ctx, b.topic, b.payload, b.payloadLen)) {
        failures_.fetch_add(1);
        LOGW("%s publish failed topic=%s: %s", name, b.topic, errorCodeStr(ErrorCode::PublishFailed));
        return;
    }
    published_.fetch_add(1);
    LOGI("%s pressed -> %s", name, b.topic);
}
