#pragma once
/**
 * @file IWifi.h
 * @brief Station uplink (WiFi) service.
 */
#include <stdint.h>
#include <stddef.h>

/** @brief Uplink state as driven by WifiModule. */
enum class WifiState : uint8_t {
    Idle,        ///< no credentials or waiting to associate
    Connecting,  ///< WiFi.begin issued
    Connected,
    ErrorWait    ///< timed out or dropped, retry after a pause
};

/** @brief Read-only view of the uplink for the bus and the status reporter. */
struct WifiService {
    WifiState (*state)(void* ctx);
    bool (*isConnected)(void* ctx);
    /** Dotted quad, empty and false while down. */
    bool (*getIP)(void* ctx, char* out, size_t len);
    /** Signal strength in dBm, 0 while down. */
    int8_t (*rssi)(void* ctx);
    /** Number of times the link came up since boot. */
    uint32_t (*linkUps)(void* ctx);
    void* ctx;
};
