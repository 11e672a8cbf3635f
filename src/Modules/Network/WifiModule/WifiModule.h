#pragma once
/**
 * @file WifiModule.h
 * @brief Station uplink: keeps the ESP32 associated to the configured access point.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/SystemLimits.h"
#include "Core/Services/IWifi.h"
#include <WiFi.h>

/** @brief Uplink credentials (`wifi.ssid`, `wifi.pass`). */
struct WifiConfig {
    char ssid[Limits::Wifi::Ssid] = "";
    char pass[Limits::Wifi::Pass] = "";
};

/**
 * @brief Active module driving Idle -> Connecting -> Connected, with a pause
 * in ErrorWait after a timeout or a dropped link.
 *
 * Registers `WifiService` as "wifi". The MQTT bus waits on it and the status
 * server starts once it reports connected.
 */
class WifiModule : public Module {
public:
    const char* moduleId() const override { return "wifi"; }
    const char* taskName() const override { return "wifi"; }
    BaseType_t taskCore() const override { return 0; }
    uint16_t taskStackSize() const override { return Limits::Wifi::TaskStackSize; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override { return (i == 0) ? "loghub" : nullptr; }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    /** @brief DHCP hostname, read at each association. Must outlive the module. */
    void setHostname(const char* name) { hostname_ = name; }

private:
    static WifiState svcState_(void* ctx);
    static bool svcIsConnected_(void* ctx);
    static bool svcGetIP_(void* ctx, char* out, size_t len);
    static int8_t svcRssi_(void* ctx);
    static uint32_t svcLinkUps_(void* ctx);

    void enter_(WifiState s);
    void associate_();

    WifiConfig cfgData;
    WifiState state_ = WifiState::Idle;
    uint32_t enteredMs_ = 0;
    uint32_t lastNoSsidLogMs_ = 0;
    uint32_t linkUps_ = 0;
    const char* hostname_ = nullptr;

    WifiService svc_{};

    ConfigVariable<char,0> ssidVar {
        NVS_KEY(NvsKeys::Wifi::Ssid),"ssid","wifi",ConfigType::CharArray,
        cfgData.ssid,ConfigPersistence::Persistent,sizeof(cfgData.ssid)
    };
    ConfigVariable<char,0> passVar {
        NVS_KEY(NvsKeys::Wifi::Pass),"pass","wifi",ConfigType::CharArray,
        cfgData.pass,ConfigPersistence::Persistent,sizeof(cfgData.pass)
    };
};
