#pragma once
/**
 * @file StationModule.h
 * @brief Firmware wrapper around GardenStation: config, device factory, termination requests.
 */
#include "Core/Log.h"
#include "Core/ModulePassive.h"
#include "Core/NvsKeys.h"
#include "Core/SystemLimits.h"
#include "Core/Services/IBus.h"
#include "Domain/StationDefaults.h"
#include "Modules/Devices/Engine/DeviceFactory.h"
#include "Modules/StationModule/GardenStation.h"
#include "Modules/StationModule/TaskActivityHost.h"
#include "Modules/StationModule/TerminationLatch.h"

/** @brief Station configuration values. */
struct StationConfig {
    char name[Limits::DeviceNameBuf] = "gardener";
    bool mock = false;
    int32_t soilPollMs = StationDefaults::SoilPollMs;
    int32_t envPollMs = StationDefaults::EnvPollMs;
    int32_t simulationMs = StationDefaults::SimulationMs;
    float simulationDelta = StationDefaults::SimulationDelta;
    uint8_t logLevel = (uint8_t)LogLevel::Info;
};

/**
 * @brief Passive module owning the station and its activity host.
 *
 * Bring-up happens in startStation(), after every module is initialized
 * and the bus task is running.
 */
class StationModule : public ModulePassive {
public:
    const char* moduleId() const override { return "station"; }

    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "mqtt";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

    /** @brief Build devices, wire activities, connect the bus. */
    bool startStation();

    /** @brief Deliver the shutdown signal. Safe to call more than once. */
    void stopStation();

    void requestTermination(TerminationRequest req);
    TerminationRequest terminationRequested() const { return termination_.pending(); }

    uint8_t activeCount() const;
    const char* stationName() const { return cfgData.name; }
    const GardenStation* station() const { return station_; }

private:
    static void onSystemMessage_(void* ctx, const char* topic, const char* payload, size_t len);

    StationConfig cfgData;
    const BusService* bus_ = nullptr;
    TaskActivityHost host_;
    DeviceFactory* factory_ = nullptr;
    GardenStation* station_ = nullptr;
    TerminationLatch termination_;

    ConfigVariable<char,0> nameVar {
        NVS_KEY(NvsKeys::Station::Name),"name","station",ConfigType::CharArray,
        (char*)cfgData.name,ConfigPersistence::Persistent,sizeof(cfgData.name)
    };
    ConfigVariable<bool,0> mockVar {
        NVS_KEY(NvsKeys::Station::Mock),"mock","station",ConfigType::Bool,
        &cfgData.mock,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> soilMsVar {
        NVS_KEY(NvsKeys::Station::SoilMs),"soil_ms","station",ConfigType::Int32,
        &cfgData.soilPollMs,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> envMsVar {
        NVS_KEY(NvsKeys::Station::EnvMs),"env_ms","station",ConfigType::Int32,
        &cfgData.envPollMs,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> simMsVar {
        NVS_KEY(NvsKeys::Station::SimMs),"sim_ms","station",ConfigType::Int32,
        &cfgData.simulationMs,ConfigPersistence::Persistent,0
    };
    ConfigVariable<float,0> simDeltaVar {
        NVS_KEY(NvsKeys::Station::SimDelta),"sim_delta","station",ConfigType::Float,
        &cfgData.simulationDelta,ConfigPersistence::Persistent,0
    };
    ConfigVariable<uint8_t,0> logLevelVar {
        NVS_KEY(NvsKeys::Station::LogLevel),"log_level","station",ConfigType::UInt8,
        &cfgData.logLevel,ConfigPersistence::Persistent,0
    };
};
