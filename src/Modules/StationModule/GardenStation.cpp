/**
 * @file GardenStation.cpp
 * @brief Implementation file.
 */

#include "GardenStation.h"
#include <string.h>
#include "Board/BoardPinMap.h"
#include "Core/MqttTopics.h"
#include "Domain/StationDefaults.h"
#include "Modules/StationModule/ReadingCodec.h"

#define LOG_TAG "GardnStn"
#include "Core/ModuleLog.h"

namespace {

uint8_t hostRunningCount(const ActivityHostService& host)
{
    return host.runningCount ? host.runningCount(host.ctx) : 0;
}

bool formatDataTopic(const char* device, char* out, size_t outLen)
{
    const int n = snprintf(out, outLen, "%s%s", MqttTopics::DataPrefix, device);
    return n > 0 && (size_t)n < outLen;
}

}  // namespace

StationSettings defaultStationSettings()
{
    StationSettings s;
    s.name = StationDefaults::StationName;
    s.mock = false;
    s.soilPollMs = StationDefaults::SoilPollMs;
    s.envPollMs = StationDefaults::EnvPollMs;
    s.simulationMs = StationDefaults::SimulationMs;
    s.simulationDelta = StationDefaults::SimulationDelta;
    s.pinButtonOn = Board::DI::ButtonOn;
    s.pinButtonOff = Board::DI::ButtonOff;
    s.pinPump = Board::DO::PumpRelay;
    s.pinSoil = Board::AI::Soil;
    s.envAddr = Board::I2C::Bme280Addr;
    s.lcdAddr = Board::I2C::LcdAddr;
    return s;
}

GardenStation::GardenStation(const BusService& bus, const ActivityHostService& host)
    : bus_(bus),
      host_(host),
      poller_(bus, host, shutdown_),
      dispatcher_(bus, shutdown_),
      router_(shutdown_),
      simulator_(host, shutdown_)
{
}

void GardenStation::recordFailure_(const char* device, const char* step, ErrorCode code)
{
    ++failureTotal_;
    if (failureCount_ >= Limits::MaxInitFailures) return;
    InitFailure& f = failures_[failureCount_++];
    f.device = device;
    f.step = step;
    f.code = code;
}

bool GardenStation::bringUp_(Device* device, ErrorCode createErr, const char* name)
{
    if (createErr != ErrorCode::None || !device) {
        recordFailure_(name, "create", (createErr != ErrorCode::None) ? createErr : ErrorCode::InitFailed);
        return false;
    }

    ErrorCode err = device->begin();
    if (err != ErrorCode::None) {
        recordFailure_(name, "begin", err);
        return false;
    }

    err = registry_.add(device);
    if (err != ErrorCode::None) {
        recordFailure_(name, "register", err);
        return false;
    }

    LOGI("%s %s ready", deviceKindStr(device->kind()), name);
    return true;
}

void GardenStation::reportFailures_() const
{
    LOGE("init aborted: %u device failure(s)", (unsigned)failureTotal_);
    for (uint8_t i = 0; i < failureCount_; ++i) {
        const InitFailure& f = failures_[i];
        LOGE("  %s: %s failed (%s)", f.device ? f.device : "-", f.step ? f.step : "-", errorCodeStr(f.code));
    }
}

bool GardenStation::init(DeviceFactory& factory, const StationSettings& settings)
{
    if (initialized_) {
        LOGW("init called twice");
        return false;
    }
    if (shutdown_.isSet()) return false;

    settings_ = settings;
    if (!settings_.name || settings_.name[0] == '\0') settings_.name = StationDefaults::StationName;
    if (settings_.mock != factory.isMock()) {
        LOGW("mock flag %d but factory mock=%d", (int)settings_.mock, (int)factory.isMock());
        settings_.mock = factory.isMock();
    }

    LOGI("station %s init (%s)", settings_.name, settings_.mock ? "mock" : "hardware");

    // Inputs
    {
        InputDevice* d = nullptr;
        ErrorCode e = factory.createInput(DeviceNames::ButtonOn, settings_.pinButtonOn, d);
        if (bringUp_(d, e, DeviceNames::ButtonOn)) buttonOn_ = d;

        d = nullptr;
        e = factory.createInput(DeviceNames::ButtonOff, settings_.pinButtonOff, d);
        if (bringUp_(d, e, DeviceNames::ButtonOff)) buttonOff_ = d;
    }

    // Actuators
    {
        ActuatorDevice* d = nullptr;
        const ErrorCode e = factory.createRelay(DeviceNames::Pump, settings_.pinPump, d);
        if (bringUp_(d, e, DeviceNames::Pump)) pump_ = d;
    }

    // Environmental sensor
    {
        SensorDevice* d = nullptr;
        const ErrorCode e = factory.createEnvSensor(DeviceNames::Env, settings_.envAddr, d);
        if (bringUp_(d, e, DeviceNames::Env)) env_ = d;
    }

    // Display
    {
        DisplayDevice* d = nullptr;
        const ErrorCode e = factory.createDisplay(DeviceNames::Display, settings_.lcdAddr, d);
        if (bringUp_(d, e, DeviceNames::Display)) display_ = d;
    }

    // Soil sensor
    {
        SoilSensor* d = nullptr;
        const ErrorCode e = factory.createSoilSensor(DeviceNames::Soil, settings_.pinSoil, d);
        if (bringUp_(d, e, DeviceNames::Soil)) soil_ = d;
    }

    if (failureTotal_ > 0) {
        reportFailures_();
        return false;
    }

    if (!wire_()) {
        // Halt anything already running before giving up.
        stop();
        return false;
    }

    initialized_ = true;
    LOGI("station %s initialized, %u devices", settings_.name, (unsigned)registry_.count());
    return true;
}

bool GardenStation::wire_()
{
    char topic[Limits::TopicBuf];
    ErrorCode err = ErrorCode::None;

    // Inputs
    if (!formatDataTopic(buttonOn_->name(), topic, sizeof(topic))) return false;
    err = dispatcher_.attach(buttonOn_, topic, MqttTopics::PayloadOn);
    if (err != ErrorCode::None) {
        LOGE("attach %s failed: %s", buttonOn_->name(), errorCodeStr(err));
        return false;
    }
    if (!formatDataTopic(buttonOff_->name(), topic, sizeof(topic))) return false;
    err = dispatcher_.attach(buttonOff_, topic, MqttTopics::PayloadOff);
    if (err != ErrorCode::None) {
        LOGE("attach %s failed: %s", buttonOff_->name(), errorCodeStr(err));
        return false;
    }

    // Actuators
    err = router_.addRoute(MqttTopics::CmdPump, pump_);
    if (err != ErrorCode::None) {
        LOGE("route %s failed: %s", MqttTopics::CmdPump, errorCodeStr(err));
        return false;
    }

    // Environmental sensor
    if (!formatDataTopic(env_->name(), topic, sizeof(topic))) return false;
    if (poller_.startPolling(env_, topic, settings_.envPollMs, &encodeEnvJson) == POLL_HANDLE_INVALID) {
        return false;
    }

    // Display
    err = display_->clear();
    if (err != ErrorCode::None) {
        LOGW("%s clear failed: %s", display_->name(), errorCodeStr(err));
    }
    err = router_.addRoute(MqttTopics::CmdLcd, display_);
    if (err != ErrorCode::None) {
        LOGE("route %s failed: %s", MqttTopics::CmdLcd, errorCodeStr(err));
        return false;
    }

    // Soil sensor
    if (!formatDataTopic(soil_->name(), topic, sizeof(topic))) return false;
    if (poller_.startPolling(soil_, topic, settings_.soilPollMs, &encodeFixed2) == POLL_HANDLE_INVALID) {
        return false;
    }
    if (settings_.mock) {
        err = simulator_.startSimulation(soil_->pin(), settings_.simulationMs, settings_.simulationDelta);
        if (err != ErrorCode::None) {
            LOGE("simulation start failed: %s", errorCodeStr(err));
            return false;
        }
    }

    // Own outbound traffic, observed for diagnostics only.
    const char* monitored[] = {MqttTopics::Soil, MqttTopics::Env, MqttTopics::ButtonOn, MqttTopics::ButtonOff};
    for (const char* t : monitored) {
        err = router_.addMonitor(t);
        if (err != ErrorCode::None) {
            LOGE("monitor %s failed: %s", t, errorCodeStr(err));
            return false;
        }
    }
    return true;
}

bool GardenStation::start()
{
    if (!initialized_) {
        LOGE("start before init");
        return false;
    }
    if (shutdown_.isSet()) return false;
    if (started_) return true;

    if (!bus_.connect || !bus_.connect(bus_.ctx)) {
        LOGE("bus connect failed: %s", errorCodeStr(ErrorCode::BusConnectFailed));
        return false;
    }
    if (!router_.subscribeAll(bus_)) {
        LOGE("route subscription failed");
        return false;
    }

    started_ = true;
    LOGI("station %s started", settings_.name);
    return true;
}

void GardenStation::stop()
{
    if (!shutdown_.trigger()) return;

    poller_.stopAll();
    dispatcher_.detachAll();
    router_.unsubscribeAll();
    LOGI("shutdown signalled, %u activities draining", (unsigned)activeCount());
}

uint8_t GardenStation::activeCount() const
{
    return hostRunningCount(host_);
}

const InitFailure* GardenStation::initFailure(uint8_t i) const
{
    return (i < failureCount_) ? &failures_[i] : nullptr;
}

StationStats GardenStation::stats() const
{
    StationStats s;
    s.published = poller_.totalPublished() + dispatcher_.published();
    s.failures = poller_.totalFailures() + dispatcher_.failures();
    s.commands = router_.handled();
    s.commandFailures = router_.failures();
    s.unknownTopics = router_.unknown();
    return s;
}
