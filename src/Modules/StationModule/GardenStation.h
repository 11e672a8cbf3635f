#pragma once
/**
 * @file GardenStation.h
 * @brief Station lifecycle: device bring-up, activity wiring and shutdown.
 *
 * Collaborators are injected: the message bus, the activity host and the
 * device factory. The station owns the registry, the pollers, the edge
 * dispatcher, the command router, the simulator and the shutdown signal.
 */

#include <stdint.h>
#include "Core/ErrorCodes.h"
#include "Core/ShutdownSignal.h"
#include "Core/SystemLimits.h"
#include "Core/Services/IActivity.h"
#include "Core/Services/IBus.h"
#include "Modules/Devices/Engine/DeviceFactory.h"
#include "Modules/Devices/Registry/DeviceRegistry.h"
#include "Modules/StationModule/CommandRouter.h"
#include "Modules/StationModule/EdgeDispatcher.h"
#include "Modules/StationModule/SensorPoller.h"
#include "Modules/StationModule/SoilSimulator.h"

struct StationSettings {
    const char* name = nullptr;
    bool mock = false;

    uint32_t soilPollMs = 0;
    uint32_t envPollMs = 0;
    uint32_t simulationMs = 0;
    float simulationDelta = 0.0f;

    uint8_t pinButtonOn = 0;
    uint8_t pinButtonOff = 0;
    uint8_t pinPump = 0;
    uint8_t pinSoil = 0;
    uint8_t envAddr = 0;
    uint8_t lcdAddr = 0;
};

/** @brief Defaults from the board pin map and StationDefaults. */
StationSettings defaultStationSettings();

/** @brief One device construction failure kept for the init report. */
struct InitFailure {
    const char* device = nullptr;
    const char* step = nullptr;
    ErrorCode code = ErrorCode::None;
};

struct StationStats {
    uint32_t published = 0;
    uint32_t failures = 0;
    uint32_t commands = 0;
    uint32_t commandFailures = 0;
    uint32_t unknownTopics = 0;
};

class GardenStation {
public:
    GardenStation(const BusService& bus, const ActivityHostService& host);

    /**
     * @brief Build and begin every device, then wire pollers and dispatchers.
     *
     * Device groups come up in order: inputs, actuators, environmental
     * sensor, display, soil sensor. Any construction failure is fatal; all
     * failures are collected and reported once.
     */
    bool init(DeviceFactory& factory, const StationSettings& settings);

    /** @brief Connect the bus and subscribe the command routes. */
    bool start();

    /** @brief Deliver the shutdown signal. Only the first call has an effect. */
    void stop();

    bool isInitialized() const { return initialized_; }
    bool isStarted() const { return started_; }
    bool isStopping() const { return shutdown_.isSet(); }

    /** @brief Activities that have not yet observed shutdown. */
    uint8_t activeCount() const;

    const char* name() const { return settings_.name; }
    bool isMock() const { return settings_.mock; }

    const DeviceRegistry& registry() const { return registry_; }
    const CommandRouter& router() const { return router_; }
    const SensorPoller& poller() const { return poller_; }
    const EdgeDispatcher& dispatcher() const { return dispatcher_; }
    const SoilSimulator& simulator() const { return simulator_; }

    uint8_t initFailureCount() const { return failureCount_; }
    const InitFailure* initFailure(uint8_t i) const;

    StationStats stats() const;

private:
    void recordFailure_(const char* device, const char* step, ErrorCode code);
    bool bringUp_(Device* device, ErrorCode createErr, const char* name);
    void reportFailures_() const;
    bool wire_();

    const BusService& bus_;
    const ActivityHostService& host_;

    ShutdownSignal shutdown_;
    DeviceRegistry registry_;
    SensorPoller poller_;
    EdgeDispatcher dispatcher_;
    CommandRouter router_;
    SoilSimulator simulator_;

    StationSettings settings_{};
    InputDevice* buttonOn_ = nullptr;
    InputDevice* buttonOff_ = nullptr;
    ActuatorDevice* pump_ = nullptr;
    SensorDevice* env_ = nullptr;
    DisplayDevice* display_ = nullptr;
    SoilSensor* soil_ = nullptr;

    InitFailure failures_[Limits::MaxInitFailures];
    uint8_t failureCount_ = 0;
    uint8_t failureTotal_ = 0;

    bool initialized_ = false;
    bool started_ = false;
};
