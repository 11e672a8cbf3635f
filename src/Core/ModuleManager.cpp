/**
 * @file ModuleManager.cpp
 * @brief Implementation file.
 */
#include "ModuleManager.h"
#include "Core/Log.h"
#include <cstring>

#define LOG_TAG_CORE "ModManag"

bool ModuleManager::add(Module* m) {
    if (!m || count >= MAX_MODULES) return false;
    modules[count++] = m;
    return true;
}

Module* ModuleManager::findById(const char* id) {
    for (uint8_t i = 0; i < count; ++i)
        if (strcmp(modules[i]->moduleId(), id) == 0) return modules[i];
    return nullptr;
}

bool ModuleManager::buildInitOrder() {
    /// Kahn topo-sort
    bool placed[MAX_MODULES] = {0};
    orderedCount = 0;

    for (uint8_t pass = 0; pass < count; ++pass) {
        bool progress = false;

        for (uint8_t i = 0; i < count; ++i) {
            Module* m = modules[i];
            if (!m || placed[i]) continue;

            bool depsOk = true;
            for (uint8_t d = 0; d < m->dependencyCount(); ++d) {
                const char* depId = m->dependency(d);
                if (!depId) continue;

                Module* dep = findById(depId);
                if (!dep) {
                    Log::error(LOG_TAG_CORE, "missing dependency: module=%s requires=%s",
                               m->moduleId(), depId);
                    return false;
                }

                bool depPlaced = false;
                for (uint8_t j = 0; j < count; ++j) {
                    if (modules[j] == dep) {
                        depPlaced = placed[j];
                        break;
                    }
                }
                if (!depPlaced) {
                    depsOk = false;
                    break;
                }
            }

            if (depsOk) {
                ordered[orderedCount++] = m;
                placed[i] = true;
                progress = true;
            }
        }

        if (orderedCount == count) return true;

        if (!progress) {
            for (uint8_t i = 0; i < count; ++i) {
                if (modules[i] && !placed[i]) {
                    Log::error(LOG_TAG_CORE, "unresolved: %s", modules[i]->moduleId());
                }
            }
            Log::error(LOG_TAG_CORE, "cyclic or unresolved deps detected");
            return false;
        }
    }

    return orderedCount == count;
}

bool ModuleManager::initAll(ConfigStore& cfg, ServiceRegistry& services) {
    Log::debug(LOG_TAG_CORE, "initAll: moduleCount=%u", (unsigned)count);
    if (!buildInitOrder()) return false;

    for (uint8_t i = 0; i < orderedCount; ++i) {
        Log::debug(LOG_TAG_CORE, "init: %s", ordered[i]->moduleId());
        ordered[i]->init(cfg, services);
    }

    /// Load persistent config after all modules registered their variables.
    cfg.loadPersistent();

    for (uint8_t i = 0; i < orderedCount; ++i) {
        ordered[i]->onConfigLoaded(cfg, services);
    }

    for (uint8_t i = 0; i < orderedCount; ++i) {
        if (!ordered[i]->hasTask()) continue;
        Log::debug(LOG_TAG_CORE, "startTask: %s", ordered[i]->moduleId());
        if (!ordered[i]->startTask()) {
            Log::error(LOG_TAG_CORE, "task start failed: %s", ordered[i]->moduleId());
            return false;
        }
    }

    Log::debug(LOG_TAG_CORE, "initAll: done");
    return true;
}
