#pragma once
/**
 * @file ModuleManager.h
 * @brief Dependency ordering and initialization for modules.
 */
#include "Module.h"

/** @brief Maximum number of modules supported at runtime. */
constexpr size_t MAX_MODULES = 10;

/**
 * @brief Registers modules, resolves dependencies, and starts tasks.
 */
class ModuleManager {
public:
    /** @brief Add a module to the manager. */
    bool add(Module* m);
    /** @brief Initialize all modules in dependency order, load config, start tasks. */
    bool initAll(ConfigStore& cfg, ServiceRegistry& services);

    uint8_t getCount() const { return count; }
    Module* getModule(uint8_t idx) const {
        if (idx >= count) return nullptr;
        return modules[idx];
    }

private:
    Module* modules[MAX_MODULES] = {nullptr};
    uint8_t count = 0;

    Module* ordered[MAX_MODULES] = {nullptr};
    uint8_t orderedCount = 0;

    Module* findById(const char* id);
    bool buildInitOrder();
};
