/**
 * @file main.cpp
 * @brief Firmware entry point and module wiring.
 */
#include <Arduino.h>
#include <Preferences.h>
#include <esp_system.h>
#include <string.h>
#include "Core/NvsKeys.h"    ///< Preference needs to be singleton-like global to work

/// Load Core Functions
#include "Core/ConfigStore.h"
#include "Core/ModuleManager.h"
#include "Core/ServiceRegistry.h"
#include "Core/SystemLimits.h"

/// Load Modules
// Logs Modules
#include "Modules/Logs/LogHubModule/LogHubModule.h"
#include "Modules/Logs/LogSerialSinkModule/LogSerialSinkModule.h"
#include "Modules/Logs/LogDispatcherModule/LogDispatcherModule.h"
// Network modules
#include "Modules/Network/WifiModule/WifiModule.h"
#include "Modules/Network/MqttBusModule/MqttBusModule.h"
#include "Modules/Network/StatusServerModule/StatusServerModule.h"
// Station
#include "Modules/StationModule/StationModule.h"

#define LOG_TAG "Main    "
#include "Core/ModuleLog.h"

static Preferences preferences;
static ConfigStore registry;

static ModuleManager moduleManager;
static ServiceRegistry services;

static LogHubModule logHubModule;
static LogDispatcherModule logDispatcherModule;
static LogSerialSinkModule logSerialSinkModule;
static WifiModule wifiModule;
static MqttBusModule mqttBusModule;
static StationModule stationModule;
static StatusServerModule statusServerModule;

static char consoleLine[Limits::ConsoleLineBuf];
static size_t consoleLen = 0;
static char consoleOut[Limits::JsonStatusBuf];

static void requireSetup(bool ok, const char* step)
{
    if (ok) return;
    Serial.printf("Setup failure: %s\n", step ? step : "unknown");
    while (true) delay(1000);
}

static void handleConsoleLine(char* line)
{
    while (*line == ' ') ++line;
    size_t n = strlen(line);
    while (n > 0 && (line[n - 1] == ' ' || line[n - 1] == '\r')) line[--n] = '\0';
    if (n == 0) return;

    if (strcmp(line, "stop") == 0) {
        stationModule.requestTermination(TerminationRequest::Stop);
        return;
    }
    if (strcmp(line, "restart") == 0) {
        stationModule.requestTermination(TerminationRequest::Restart);
        return;
    }
    if (strcmp(line, "cfg") == 0) {
        if (registry.toJson(consoleOut, sizeof(consoleOut))) {
            Serial.println(consoleOut);
        } else {
            Serial.println("cfg: output too large");
        }
        return;
    }
    if (strncmp(line, "cfg ", 4) == 0) {
        uint8_t changed = 0;
        ErrorCode err = registry.applyJson(line + 4, &changed);
        if (err != ErrorCode::None) {
            Serial.printf("cfg: %s\n", errorCodeStr(err));
            return;
        }
        Serial.printf("cfg: %u value(s) changed, applied on restart\n", (unsigned)changed);
        return;
    }

    Serial.printf("unknown command '%s' (stop | restart | cfg [json])\n", line);
}

static void pollConsole()
{
    while (Serial.available() > 0) {
        int c = Serial.read();
        if (c < 0) return;
        if (c == '\n') {
            consoleLine[consoleLen] = '\0';
            handleConsoleLine(consoleLine);
            consoleLen = 0;
            continue;
        }
        if (consoleLen + 1 < sizeof(consoleLine)) {
            consoleLine[consoleLen++] = (char)c;
        }
    }
}

static void terminate(TerminationRequest req)
{
    stationModule.stopStation();

    const uint32_t start = millis();
    uint8_t active = stationModule.activeCount();
    while (active > 0 && (millis() - start) < Limits::Activity::DrainTimeoutMs) {
        delay(50);
        active = stationModule.activeCount();
    }
    if (active > 0) {
        LOGW("%u activities still running after %lums", (unsigned)active,
             (unsigned long)Limits::Activity::DrainTimeoutMs);
    } else {
        LOGI("all activities drained");
    }

    if (req == TerminationRequest::Restart) {
        LOGI("restarting");
        delay(200);
        esp_restart();
    }

    LOGI("station stopped, send 'restart' to resume");
    while (true) {
        pollConsole();
        if (stationModule.terminationRequested() == TerminationRequest::Restart) {
            esp_restart();
        }
        delay(100);
    }
}

void setup()
{
    Serial.begin(115200);
    delay(50);

    requireSetup(preferences.begin(NvsKeys::StorageNamespace, false), "open preferences");
    registry.setPreferences(preferences);

    moduleManager.add(&logHubModule);
    moduleManager.add(&logDispatcherModule);
    moduleManager.add(&logSerialSinkModule);
    moduleManager.add(&wifiModule);
    moduleManager.add(&mqttBusModule);
    moduleManager.add(&stationModule);

    statusServerModule.setStation(&stationModule);
    wifiModule.setHostname(stationModule.stationName());
    moduleManager.add(&statusServerModule);

    requireSetup(moduleManager.initAll(registry, services), "module init");

    mqttBusModule.setClientId(stationModule.stationName());
    requireSetup(stationModule.startStation(), "station start");

    LOGI("station %s running", stationModule.stationName());
}

void loop() {
    pollConsole();

    TerminationRequest req = stationModule.terminationRequested();
    if (req != TerminationRequest::None) terminate(req);

    delay(20);
}
