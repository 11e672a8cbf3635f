#pragma once
/**
 * @file LogSerialSinkModule.h
 * @brief Prints log entries on the USB serial console.
 */
#include "Core/ModulePassive.h"
#include "Core/Services/ILogger.h"
#include "Core/ServiceRegistry.h"

/**
 * @brief `[hh:mm:ss.mmm][L][tag] msg`, message colored by level unless
 * `setColors(false)` was called before init (plain terminals, log capture).
 */
class LogSerialSinkModule : public ModulePassive {
public:
    const char* moduleId() const override { return "logs.serial"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override { return (i == 0) ? "loghub" : nullptr; }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;

    void setColors(bool on) { colors_ = on; }

private:
    static void write_(void* ctx, const LogEntry& e);

    bool colors_ = true;
};
