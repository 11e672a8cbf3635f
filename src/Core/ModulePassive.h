#pragma once
/**
 * @file ModulePassive.h
 * @brief Module without its own FreeRTOS task.
 */
#include "Core/Module.h"

/**
 * @brief Does all its work in init() and onConfigLoaded(), or from callers
 * running on other tasks (station bring-up, log sinks, status reporter).
 * ModuleManager never calls startTask() for it.
 */
class ModulePassive : public Module {
public:
    bool hasTask() const override { return false; }
    const char* taskName() const override { return "-"; }
    void loop() override {}
};
