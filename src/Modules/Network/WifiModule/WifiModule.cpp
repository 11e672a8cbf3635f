/**
 * @file WifiModule.cpp
 * @brief Implementation file.
 */
#include "WifiModule.h"
#define LOG_TAG "WifiLink"
#include "Core/ModuleLog.h"

WifiState WifiModule::svcState_(void* ctx)
{
    return static_cast<WifiModule*>(ctx)->state_;
}

bool WifiModule::svcIsConnected_(void* ctx)
{
    return static_cast<WifiModule*>(ctx)->state_ == WifiState::Connected && WiFi.isConnected();
}

bool WifiModule::svcGetIP_(void* ctx, char* out, size_t len)
{
    if (!out || len == 0) return false;
    out[0] = '\0';
    if (!svcIsConnected_(ctx)) return false;

    const IPAddress ip = WiFi.localIP();
    const int n = snprintf(out, len, "%u.%u.%u.%u", ip[0], ip[1], ip[2], ip[3]);
    return n > 0 && (size_t)n < len;
}

int8_t WifiModule::svcRssi_(void* ctx)
{
    return svcIsConnected_(ctx) ? (int8_t)WiFi.RSSI() : 0;
}

uint32_t WifiModule::svcLinkUps_(void* ctx)
{
    return static_cast<WifiModule*>(ctx)->linkUps_;
}

void WifiModule::enter_(WifiState s)
{
    if (s == state_) return;
    state_ = s;
    enteredMs_ = millis();
}

void WifiModule::associate_()
{
    if (cfgData.ssid[0] == '\0') {
        const uint32_t now = millis();
        if ((now - lastNoSsidLogMs_) >= Limits::Wifi::RetryMs) {
            lastNoSsidLogMs_ = now;
            LOGW("no uplink configured, set wifi.ssid with 'cfg'");
        }
        return;
    }

    WiFi.disconnect(false, false);
    WiFi.mode(WIFI_STA);
    if (hostname_ && hostname_[0] != '\0') WiFi.setHostname(hostname_);
    WiFi.setSleep(false);
    WiFi.begin(cfgData.ssid, cfgData.pass);

    LOGI("associating with '%s' as %s", cfgData.ssid, hostname_ ? hostname_ : "-");
    enter_(WifiState::Connecting);
}

void WifiModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(ssidVar);
    cfg.registerVar(passVar);

    svc_.state = &WifiModule::svcState_;
    svc_.isConnected = &WifiModule::svcIsConnected_;
    svc_.getIP = &WifiModule::svcGetIP_;
    svc_.rssi = &WifiModule::svcRssi_;
    svc_.linkUps = &WifiModule::svcLinkUps_;
    svc_.ctx = this;
    if (!services.add("wifi", &svc_)) {
        LOGE("wifi service not registered");
    }

    // Credentials live in ConfigStore; keep the driver from writing its own copy to flash.
    WiFi.persistent(false);
    enter_(WifiState::Idle);
}

void WifiModule::loop()
{
    const uint32_t inState = millis() - enteredMs_;

    switch (state_) {
    case WifiState::Idle:
        associate_();
        vTaskDelay(pdMS_TO_TICKS(1000));
        return;

    case WifiState::Connecting:
        if (WiFi.isConnected()) {
            ++linkUps_;
            const IPAddress ip = WiFi.localIP();
            LOGI("uplink up ip=%u.%u.%u.%u rssi=%d (link #%lu)",
                 ip[0], ip[1], ip[2], ip[3], WiFi.RSSI(), (unsigned long)linkUps_);
            enter_(WifiState::Connected);
        } else if (inState > Limits::Wifi::ConnectTimeoutMs) {
            LOGW("'%s' not reached within %lums", cfgData.ssid,
                 (unsigned long)Limits::Wifi::ConnectTimeoutMs);
            WiFi.disconnect(false, false);
            enter_(WifiState::ErrorWait);
        }
        vTaskDelay(pdMS_TO_TICKS(200));
        return;

    case WifiState::Connected:
        if (!WiFi.isConnected()) {
            LOGW("uplink lost after %lus", (unsigned long)(inState / 1000));
            enter_(WifiState::ErrorWait);
        }
        vTaskDelay(pdMS_TO_TICKS(1000));
        return;

    case WifiState::ErrorWait:
        if (inState > Limits::Wifi::RetryPauseMs) enter_(WifiState::Idle);
        vTaskDelay(pdMS_TO_TICKS(500));
        return;
    }
}
