#pragma once
/**
 * @file MqttBusModule.h
 * @brief MQTT client module exposing the station message bus.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/SystemLimits.h"
#include "Core/Services/IBus.h"
#include "Core/Services/IWifi.h"
#include <AsyncMqttClient.h>
#include <freertos/semphr.h>
#include <atomic>

/** @brief MQTT configuration values. */
struct MqttBusConfig {
    char host[Limits::Mqtt::Buffers::Host] = "otto";
    int32_t port = Limits::Mqtt::Defaults::Port;
    char user[Limits::Mqtt::Buffers::User] = "";
    char pass[Limits::Mqtt::Buffers::Pass] = "";
};

/** @brief MQTT connection state. */
enum class MqttBusState : uint8_t { Idle, WaitingNetwork, Connecting, Connected, ErrorWait };

/**
 * @brief Active module that owns the broker session and routes inbound messages.
 *
 * The session is only opened once `BusService::connect` has been called.
 * Subscriptions survive reconnects: they are re-issued on every connect.
 */
class MqttBusModule : public Module {
public:
    const char* moduleId() const override { return "mqtt"; }
    const char* taskName() const override { return "mqtt"; }
    BaseType_t taskCore() const override { return 0; }
    uint16_t taskStackSize() const override { return Limits::Mqtt::TaskStackSize; }

    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "wifi";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    /** @brief Client identifier announced to the broker. Call before connect. */
    void setClientId(const char* id);

    bool connect();
    bool publish(const char* topic, const char* payload, size_t len);
    bool subscribe(const char* topic, BusMessageFn fn, void* fnCtx);
    bool unsubscribe(const char* topic);
    bool isConnected() const { return state_.load() == MqttBusState::Connected; }

    uint32_t rxDropped() const { return rxDropped_.load(); }

private:
    struct Subscription {
        char topic[Limits::TopicBuf];
        BusMessageFn fn;
        void* fnCtx;
        bool used;
    };

    struct RxMsg {
        char topic[Limits::Mqtt::Buffers::RxTopic];
        char payload[Limits::Mqtt::Buffers::RxPayload];
        size_t len;
    };

    MqttBusConfig cfgData;
    std::atomic<MqttBusState> state_{MqttBusState::Idle};
    uint32_t stateTs = 0;
    std::atomic<bool> connectRequested_{false};

    AsyncMqttClient client;
    const WifiService* wifiSvc = nullptr;
    BusService busSvc{};

    char clientId[Limits::Mqtt::Buffers::ClientId] = "gardener";

    Subscription subs_[Limits::Mqtt::Capacity::MaxSubscriptions] = {};
    SemaphoreHandle_t subsMutex_ = nullptr;
    SemaphoreHandle_t publishMutex_ = nullptr;
    QueueHandle_t rxQ = nullptr;
    std::atomic<uint32_t> rxDropped_{0};

    uint32_t retryDelayMs_ = Limits::Mqtt::Timing::ReconnectMinMs;

    ConfigVariable<char,0> hostVar {
        NVS_KEY(NvsKeys::Mqtt::Host),"host","mqtt",ConfigType::CharArray,
        (char*)cfgData.host,ConfigPersistence::Persistent,sizeof(cfgData.host)
    };
    ConfigVariable<int32_t,0> portVar {
        NVS_KEY(NvsKeys::Mqtt::Port),"port","mqtt",ConfigType::Int32,
        &cfgData.port,ConfigPersistence::Persistent,0
    };
    ConfigVariable<char,0> userVar {
        NVS_KEY(NvsKeys::Mqtt::User),"user","mqtt",ConfigType::CharArray,
        (char*)cfgData.user,ConfigPersistence::Persistent,sizeof(cfgData.user)
    };
    ConfigVariable<char,0> passVar {
        NVS_KEY(NvsKeys::Mqtt::Pass),"pass","mqtt",ConfigType::CharArray,
        (char*)cfgData.pass,ConfigPersistence::Persistent,sizeof(cfgData.pass)
    };

    void setState(MqttBusState s);
    void connectMqtt();
    void resubscribeAll_();
    void dispatch_(const RxMsg& msg);
    bool networkReady_() const;

    void onConnect(bool sessionPresent);
    void onDisconnect(AsyncMqttClientDisconnectReason reason);
    void onMessage(char* topic, char* payload, AsyncMqttClientMessageProperties properties,
                   size_t len, size_t index, size_t total);

    static bool svcConnect(void* ctx);
    static bool svcPublish(void* ctx, const char* topic, const char* payload, size_t len);
    static bool svcSubscribe(void* ctx, const char* topic, BusMessageFn fn, void* fnCtx);
    static bool svcUnsubscribe(void* ctx, const char* topic);
    static bool svcIsConnected(void* ctx);
};
