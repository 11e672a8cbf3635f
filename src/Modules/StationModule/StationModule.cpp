/**
 * @file StationModule.cpp
 * @brief Implementation file.
 */
#include "StationModule.h"
#include "Board/BoardPinMap.h"
#include "Core/MqttTopics.h"
#include "Modules/Devices/Hardware/HardwareDeviceFactory.h"
#include "Modules/Devices/Mock/MockDeviceFactory.h"

#define LOG_TAG "StatnMod"
#include "Core/ModuleLog.h"

void StationModule::onSystemMessage_(void* ctx, const char* topic, const char* payload, size_t len)
{
    StationModule* self = static_cast<StationModule*>(ctx);
    const TerminationRequest req = TerminationLatch::parse(payload, len);
    if (req == TerminationRequest::None) {
        LOGW("%s: unsupported request %.*s", topic, (int)len, payload);
        return;
    }
    self->requestTermination(req);
}

void StationModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(nameVar);
    cfg.registerVar(mockVar);
    cfg.registerVar(soilMsVar);
    cfg.registerVar(envMsVar);
    cfg.registerVar(simMsVar);
    cfg.registerVar(simDeltaVar);
    cfg.registerVar(logLevelVar);

    bus_ = services.get<BusService>("bus");
    services.add("activities", &host_.service());
}

void StationModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    uint8_t lvl = cfgData.logLevel;
    if (lvl > (uint8_t)LogLevel::Error) lvl = (uint8_t)LogLevel::Error;
    Log::setMinLevel((LogLevel)lvl);
}

bool StationModule::startStation()
{
    if (station_) return station_->isStarted();
    if (!bus_) {
        LOGE("bus service missing");
        return false;
    }

    if (cfgData.soilPollMs <= 0 || cfgData.envPollMs <= 0 || cfgData.simulationMs <= 0) {
        LOGE("invalid intervals soil=%ld env=%ld sim=%ld",
             (long)cfgData.soilPollMs, (long)cfgData.envPollMs, (long)cfgData.simulationMs);
        return false;
    }

    StationSettings settings = defaultStationSettings();
    settings.name = cfgData.name[0] ? cfgData.name : StationDefaults::StationName;
    settings.mock = cfgData.mock;
    settings.soilPollMs = (uint32_t)cfgData.soilPollMs;
    settings.envPollMs = (uint32_t)cfgData.envPollMs;
    settings.simulationMs = (uint32_t)cfgData.simulationMs;
    settings.simulationDelta = cfgData.simulationDelta;

    if (settings.mock) {
        factory_ = new MockDeviceFactory();
    } else {
        factory_ = new HardwareDeviceFactory(Board::I2C::Sda, Board::I2C::Scl,
                                             StationDefaults::LcdCols, StationDefaults::LcdRows);
    }
    station_ = new GardenStation(*bus_, host_.service());

    if (!station_->init(*factory_, settings)) return false;

    // c/system outlives stopStation(): a halted station still takes a remote restart.
    if (!bus_->subscribe(bus_->ctx, MqttTopics::CmdSystem, &StationModule::onSystemMessage_, this)) {
        LOGW("subscribe failed topic=%s", MqttTopics::CmdSystem);
    }

    return station_->start();
}

void StationModule::stopStation()
{
    if (station_) station_->stop();
}

void StationModule::requestTermination(TerminationRequest req)
{
    if (!termination_.request(req)) return;
    LOGI("%s requested", req == TerminationRequest::Restart ? "restart" : "stop");
}

uint8_t StationModule::activeCount() const
{
    return station_ ? station_->activeCount() : 0;
}
