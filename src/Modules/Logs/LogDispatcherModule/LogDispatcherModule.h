#pragma once
/**
 * @file LogDispatcherModule.h
 * @brief Module that dispatches log entries to sinks.
 */
#include "Core/Module.h"
#include "Core/ServiceRegistry.h"
#include "Core/Services/ILogger.h"
#include "Core/LogHub.h"

/**
 * @brief Drains the log hub and fans entries out to every registered sink.
 */
class LogDispatcherModule : public Module {
public:
    const char* moduleId() const override { return "log.dispatcher"; }
    const char* taskName() const override { return "LogDispatch"; }

    /** @brief Depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    uint16_t taskStackSize() const override { return 4096; }
    BaseType_t taskCore() const override { return 1; }

private:
    LogHub* _hub = nullptr;
    const LogSinkRegistryService* _sinkReg = nullptr;
    uint32_t _lastDropped = 0;
};
