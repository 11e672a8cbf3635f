/**
 * @file MqttBusModule.cpp
 * @brief Implementation file.
 */
#include "MqttBusModule.h"
#include <esp_system.h>
#include <string.h>
#define LOG_TAG "MqttBusM"
#include "Core/ModuleLog.h"

static uint32_t jitterMs(uint32_t baseMs, uint8_t pct) {
    if (baseMs == 0 || pct == 0) return baseMs;
    uint32_t span = (baseMs * pct) / 100U;
    uint32_t r = esp_random();
    uint32_t delta = r % (2U * span + 1U);
    int32_t out = (int32_t)baseMs + (int32_t)delta - (int32_t)span;
    if (out < 0) out = 0;
    return (uint32_t)out;
}

static const char* disconnectReasonStr(AsyncMqttClientDisconnectReason r) {
    switch (r) {
        case AsyncMqttClientDisconnectReason::TCP_DISCONNECTED: return "tcp";
        case AsyncMqttClientDisconnectReason::MQTT_UNACCEPTABLE_PROTOCOL_VERSION: return "protocol";
        case AsyncMqttClientDisconnectReason::MQTT_IDENTIFIER_REJECTED: return "id-rejected";
        case AsyncMqttClientDisconnectReason::MQTT_SERVER_UNAVAILABLE: return "unavailable";
        case AsyncMqttClientDisconnectReason::MQTT_MALFORMED_CREDENTIALS: return "credentials";
        case AsyncMqttClientDisconnectReason::MQTT_NOT_AUTHORIZED: return "not-authorized";
        default: return "other";
    }
}

bool MqttBusModule::svcConnect(void* ctx) {
    return static_cast<MqttBusModule*>(ctx)->connect();
}

bool MqttBusModule::svcPublish(void* ctx, const char* topic, const char* payload, size_t len) {
    return static_cast<MqttBusModule*>(ctx)->publish(topic, payload, len);
}

bool MqttBusModule::svcSubscribe(void* ctx, const char* topic, BusMessageFn fn, void* fnCtx) {
    return static_cast<MqttBusModule*>(ctx)->subscribe(topic, fn, fnCtx);
}

bool MqttBusModule::svcUnsubscribe(void* ctx, const char* topic) {
    return static_cast<MqttBusModule*>(ctx)->unsubscribe(topic);
}

bool MqttBusModule::svcIsConnected(void* ctx) {
    return static_cast<MqttBusModule*>(ctx)->isConnected();
}

void MqttBusModule::setState(MqttBusState s) {
    state_.store(s);
    stateTs = millis();
}

void MqttBusModule::setClientId(const char* id) {
    if (!id || id[0] == '\0') return;
    snprintf(clientId, sizeof(clientId), "%s", id);
}

bool MqttBusModule::networkReady_() const {
    return wifiSvc && wifiSvc->isConnected && wifiSvc->isConnected(wifiSvc->ctx);
}

void MqttBusModule::connectMqtt() {
    client.setClientId(clientId);
    client.setServer(cfgData.host, (uint16_t)cfgData.port);
    if (cfgData.user[0] != '\0') client.setCredentials(cfgData.user, cfgData.pass);
    client.connect();
    setState(MqttBusState::Connecting);
    LOGI("Connecting to %s:%ld as %s", cfgData.host, (long)cfgData.port, clientId);
}

void MqttBusModule::resubscribeAll_() {
    char topic[Limits::TopicBuf];
    for (uint8_t i = 0; i < Limits::Mqtt::Capacity::MaxSubscriptions; ++i) {
        bool used = false;
        xSemaphoreTake(subsMutex_, portMAX_DELAY);
        used = subs_[i].used;
        if (used) memcpy(topic, subs_[i].topic, sizeof(topic));
        xSemaphoreGive(subsMutex_);
        if (!used) continue;
        if (client.subscribe(topic, 0) == 0) {
            LOGW("re-subscribe failed topic=%s", topic);
        }
    }
}

void MqttBusModule::onConnect(bool) {
    LOGI("Connected");
    retryDelayMs_ = Limits::Mqtt::Timing::ReconnectMinMs;
    setState(MqttBusState::Connected);
    resubscribeAll_();
}

void MqttBusModule::onDisconnect(AsyncMqttClientDisconnectReason reason) {
    if (state_.load() == MqttBusState::Idle) return;
    LOGW("Disconnected (%s)", disconnectReasonStr(reason));
    setState(MqttBusState::ErrorWait);
}

void MqttBusModule::onMessage(char* topic, char* payload, AsyncMqttClientMessageProperties,
                              size_t len, size_t, size_t total) {
    if (!rxQ || !topic) return;
    if (len != total) {
        rxDropped_.fetch_add(1);
        return;
    }

    size_t topicLen = strlen(topic);
    if (topicLen >= sizeof(RxMsg{}.topic) || len >= sizeof(RxMsg{}.payload)) {
        rxDropped_.fetch_add(1);
        return;
    }

    RxMsg m{};
    memcpy(m.topic, topic, topicLen);
    m.topic[topicLen] = '\0';
    if (payload && len > 0) memcpy(m.payload, payload, len);
    m.payload[len] = '\0';
    m.len = len;

    if (xQueueSend(rxQ, &m, 0) != pdTRUE) {
        rxDropped_.fetch_add(1);
    }
}

void MqttBusModule::dispatch_(const RxMsg& msg) {
    BusMessageFn fn = nullptr;
    void* fnCtx = nullptr;

    xSemaphoreTake(subsMutex_, portMAX_DELAY);
    for (uint8_t i = 0; i < Limits::Mqtt::Capacity::MaxSubscriptions; ++i) {
        if (subs_[i].used && strcmp(subs_[i].topic, msg.topic) == 0) {
            fn = subs_[i].fn;
            fnCtx = subs_[i].fnCtx;
            break;
        }
    }
    xSemaphoreGive(subsMutex_);

    if (!fn) {
        LOGW("no subscriber for topic %s", msg.topic);
        return;
    }
    fn(fnCtx, msg.topic, msg.payload, msg.len);
}

bool MqttBusModule::connect() {
    if (isConnected()) return true;
    connectRequested_.store(true);

    const uint32_t start = millis();
    while (millis() - start < Limits::Mqtt::Timing::ConnectTimeoutMs) {
        if (isConnected()) return true;
        vTaskDelay(pdMS_TO_TICKS(100));
    }
    LOGE("connect timeout host=%s", cfgData.host);
    return false;
}

bool MqttBusModule::publish(const char* topic, const char* payload, size_t len) {
    if (!topic || (!payload && len > 0)) return false;
    if (!isConnected()) return false;

    xSemaphoreTake(publishMutex_, portMAX_DELAY);
    uint16_t id = client.publish(topic, 0, false, payload, len);
    xSemaphoreGive(publishMutex_);
    return id != 0;
}

bool MqttBusModule::subscribe(const char* topic, BusMessageFn fn, void* fnCtx) {
    if (!topic || topic[0] == '\0' || !fn) return false;
    if (strlen(topic) >= Limits::TopicBuf) return false;

    int8_t slot = -1;
    xSemaphoreTake(subsMutex_, portMAX_DELAY);
    for (uint8_t i = 0; i < Limits::Mqtt::Capacity::MaxSubscriptions; ++i) {
        if (subs_[i].used && strcmp(subs_[i].topic, topic) == 0) {
            slot = -2;
            break;
        }
        if (!subs_[i].used && slot == -1) slot = (int8_t)i;
    }
    if (slot >= 0) {
        Subscription& s = subs_[slot];
        snprintf(s.topic, sizeof(s.topic), "%s", topic);
        s.fn = fn;
        s.fnCtx = fnCtx;
        s.used = true;
    }
    xSemaphoreGive(subsMutex_);

    if (slot == -2) {
        LOGW("already subscribed topic=%s", topic);
        return false;
    }
    if (slot == -1) {
        LOGW("subscription table full, topic=%s", topic);
        return false;
    }

    // Offline subscriptions are issued on the next connect.
    if (isConnected() && client.subscribe(topic, 0) == 0) {
        LOGW("subscribe failed topic=%s", topic);
        return false;
    }
    return true;
}

bool MqttBusModule::unsubscribe(const char* topic) {
    if (!topic) return false;

    bool found = false;
    xSemaphoreTake(subsMutex_, portMAX_DELAY);
    for (uint8_t i = 0; i < Limits::Mqtt::Capacity::MaxSubscriptions; ++i) {
        if (subs_[i].used && strcmp(subs_[i].topic, topic) == 0) {
            subs_[i].used = false;
            found = true;
            break;
        }
    }
    xSemaphoreGive(subsMutex_);

    if (!found) return false;
    if (isConnected() && client.unsubscribe(topic) == 0) {
        LOGW("unsubscribe failed topic=%s", topic);
        return false;
    }
    return true;
}

void MqttBusModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(hostVar);
    cfg.registerVar(portVar);
    cfg.registerVar(userVar);
    cfg.registerVar(passVar);

    wifiSvc = services.get<WifiService>("wifi");

    subsMutex_ = xSemaphoreCreateMutex();
    publishMutex_ = xSemaphoreCreateMutex();
    rxQ = xQueueCreate(Limits::Mqtt::Capacity::RxQueueLen, sizeof(RxMsg));
    if (!subsMutex_ || !publishMutex_ || !rxQ) {
        LOGE("init failed: out of memory");
        return;
    }

    client.onConnect([this](bool sp){ this->onConnect(sp); });
    client.onDisconnect([this](AsyncMqttClientDisconnectReason r){ this->onDisconnect(r); });
    client.onMessage([this](char* t, char* p, AsyncMqttClientMessageProperties pr, size_t l, size_t i, size_t tot){
        this->onMessage(t, p, pr, l, i, tot);
    });

    busSvc.connect = MqttBusModule::svcConnect;
    busSvc.publish = MqttBusModule::svcPublish;
    busSvc.subscribe = MqttBusModule::svcSubscribe;
    busSvc.unsubscribe = MqttBusModule::svcUnsubscribe;
    busSvc.isConnected = MqttBusModule::svcIsConnected;
    busSvc.ctx = this;
    services.add("bus", &busSvc);

    setState(MqttBusState::Idle);
}

void MqttBusModule::loop() {
    switch (state_.load()) {
    case MqttBusState::Idle:
        if (connectRequested_.load()) setState(MqttBusState::WaitingNetwork);
        vTaskDelay(pdMS_TO_TICKS(200));
        break;

    case MqttBusState::WaitingNetwork:
        if (networkReady_()) connectMqtt();
        vTaskDelay(pdMS_TO_TICKS(200));
        break;

    case MqttBusState::Connecting:
        if (millis() - stateTs > Limits::Mqtt::Timing::ConnectTimeoutMs) {
            LOGW("Connect timeout");
            client.disconnect();
            setState(MqttBusState::ErrorWait);
        }
        vTaskDelay(pdMS_TO_TICKS(100));
        break;

    case MqttBusState::Connected: {
        RxMsg m;
        if (xQueueReceive(rxQ, &m, pdMS_TO_TICKS(50)) == pdTRUE) dispatch_(m);
        break;
    }

    case MqttBusState::ErrorWait:
        if (millis() - stateTs >= retryDelayMs_) {
            uint32_t next = retryDelayMs_ * 2U;
            if (next > Limits::Mqtt::Timing::ReconnectMaxMs) next = Limits::Mqtt::Timing::ReconnectMaxMs;
            retryDelayMs_ = jitterMs(next, 10);
            setState(MqttBusState::WaitingNetwork);
        }
        vTaskDelay(pdMS_TO_TICKS(200));
        break;
    }
}
