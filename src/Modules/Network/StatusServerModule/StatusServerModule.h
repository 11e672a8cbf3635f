#pragma once
/**
 * @file StatusServerModule.h
 * @brief Read-only HTTP status reporter.
 */
#include "Core/Module.h"
#include "Core/Services/IBus.h"
#include "Core/Services/IWifi.h"
#include <ESPAsyncWebServer.h>

class StationModule;

/**
 * @brief Serves `GET /status` (station JSON) and `GET /health` once WiFi is up.
 */
class StatusServerModule : public Module {
public:
    const char* moduleId() const override { return "status"; }
    const char* taskName() const override { return "status"; }
    BaseType_t taskCore() const override { return 0; }

    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "wifi";
        if (i == 1) return "station";
        return nullptr;
    }

    /** @brief Station reported by `/status`. Call before ModuleManager::initAll. */
    void setStation(const StationModule* station) { station_ = station; }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    /** @brief Render the status document. Returns false when it does not fit. */
    bool buildStatusJson(char* out, size_t outLen) const;

private:
    static constexpr uint16_t kServerPort = 80;

    void startServer_();

    AsyncWebServer server_{kServerPort};
    const WifiService* wifiSvc_ = nullptr;
    const BusService* busSvc_ = nullptr;
    const StationModule* station_ = nullptr;
    bool started_ = false;
};
