#pragma once
/**
 * @file IBus.h
 * @brief Message bus service interface (MQTT on target).
 */

#include <stddef.h>

/** @brief Inbound message callback. Payload is not NUL terminated. */
typedef void (*BusMessageFn)(void* ctx, const char* topic, const char* payload, size_t len);

/**
 * @brief Publish/subscribe client shared by every station activity.
 *
 * `publish` is fire-and-forget and must be safe to call from several tasks.
 * It returns false when the message could not be handed to the transport.
 */
struct BusService {
    bool (*connect)(void* ctx);
    bool (*publish)(void* ctx, const char* topic, const char* payload, size_t len);
    bool (*subscribe)(void* ctx, const char* topic, BusMessageFn fn, void* fnCtx);
    bool (*unsubscribe)(void* ctx, const char* topic);
    bool (*isConnected)(void* ctx);
    void* ctx;
};
