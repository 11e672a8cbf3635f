/**
 * @file StatusServerModule.cpp
 * @brief Implementation file.
 */
#include "StatusServerModule.h"
#include <ArduinoJson.h>
#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include "Modules/StationModule/StationModule.h"
#define LOG_TAG "StatusSv"
#include "Core/ModuleLog.h"

void StatusServerModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    (void)cfg;
    wifiSvc_ = services.get<WifiService>("wifi");
    busSvc_ = services.get<BusService>("bus");
}

bool StatusServerModule::buildStatusJson(char* out, size_t outLen) const
{
    if (!out || outLen == 0) return false;

    StaticJsonDocument<Limits::JsonStatusBuf> doc;
    const GardenStation* st = station_ ? station_->station() : nullptr;

    doc["station"] = station_ ? station_->stationName() : "";
    doc["mock"] = st ? st->isMock() : false;
    const bool busUp = busSvc_ && busSvc_->isConnected && busSvc_->isConnected(busSvc_->ctx);
    doc["bus"] = busUp ? "connected" : "down";
    char ip[16] = "";
    if (wifiSvc_ && wifiSvc_->getIP && wifiSvc_->getIP(wifiSvc_->ctx, ip, sizeof(ip))) {
        doc["ip"] = ip;
        doc["rssi"] = wifiSvc_->rssi ? wifiSvc_->rssi(wifiSvc_->ctx) : 0;
    }
    doc["stopping"] = st ? st->isStopping() : false;
    doc["active"] = station_ ? station_->activeCount() : 0;

    JsonArray devices = doc.createNestedArray("devices");
    StationStats stats;
    if (st) {
        const DeviceRegistry& reg = st->registry();
        for (uint8_t i = 0; i < reg.count(); ++i) {
            const Device* d = reg.at(i);
            if (!d) continue;
            JsonObject o = devices.createNestedObject();
            o["name"] = d->name();
            o["kind"] = deviceKindStr(d->kind());
        }
        stats = st->stats();
    }
    doc["published"] = stats.published;
    doc["failures"] = stats.failures;
    doc["commands"] = stats.commands;
    doc["command_failures"] = stats.commandFailures;
    doc["unknown_topics"] = stats.unknownTopics;

    if (doc.overflowed() || measureJson(doc) >= outLen) return false;
    serializeJson(doc, out, outLen);
    return true;
}

void StatusServerModule::startServer_()
{
    server_.on("/health", HTTP_GET, [](AsyncWebServerRequest* request) {
        request->send(200, "text/plain", "ok");
    });
    server_.on("/status", HTTP_GET, [this](AsyncWebServerRequest* request) {
        char out[Limits::JsonStatusBuf];
        if (!buildStatusJson(out, sizeof(out))) {
            LOGW("status report does not fit %u bytes", (unsigned)sizeof(out));
            if (!writeErrorJson(out, sizeof(out), ErrorCode::EncodeFailed, "status")) {
                request->send(500, "text/plain", "error");
                return;
            }
            request->send(500, "application/json", out);
            return;
        }
        request->send(200, "application/json", out);
    });
    server_.onNotFound([](AsyncWebServerRequest* request) {
        request->send(404, "text/plain", "not found");
    });

    server_.begin();
    started_ = true;
    LOGI("HTTP status server listening on port %u", (unsigned)kServerPort);
}

void StatusServerModule::loop()
{
    if (!started_ && wifiSvc_ && wifiSvc_->isConnected && wifiSvc_->isConnected(wifiSvc_->ctx)) {
        startServer_();
    }
    vTaskDelay(pdMS_TO_TICKS(1000));
}
