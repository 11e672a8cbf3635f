#pragma once

#include <stddef.h>
#include <stdint.h>

/**
 * @file SystemLimits.h
 * @brief Shared compile-time limits used across Core and modules.
 */

namespace Limits {

/** @brief Maximum device name length including terminator. */
constexpr size_t DeviceNameBuf = 16;
/** @brief Device Registry capacity. */
constexpr uint8_t MaxDevices = 8;
/** @brief Polling jobs tracked by `SensorPoller`. */
constexpr uint8_t MaxPollers = 4;
/** @brief Input subscriptions tracked by `EdgeDispatcher`. */
constexpr uint8_t MaxEdgeBindings = 4;
/** @brief Edge handlers a single input driver accepts. */
constexpr uint8_t MaxEdgeHandlers = 2;
/** @brief Route table capacity in `CommandRouter`. */
constexpr uint8_t MaxRoutes = 8;
/** @brief Concurrent simulations tracked by `SoilSimulator`. */
constexpr uint8_t MaxSimulations = 2;
/** @brief Activities an `ActivityHost` can run. */
constexpr uint8_t MaxActivities = 8;
/** @brief Construction failures kept for the single init report. */
constexpr uint8_t MaxInitFailures = 8;

/** @brief Topic buffer length for outbound and inbound topics. */
constexpr size_t TopicBuf = 64;
/** @brief Encoded reading payload buffer (`d/soil`, `d/env`). */
constexpr size_t PayloadBuf = 128;
/** @brief JSON capacity for the environmental reading document. */
constexpr size_t JsonEnvBuf = 128;
/** @brief JSON capacity for `ConfigStore::applyJson` root document. */
constexpr size_t JsonConfigApplyBuf = 1024;
/** @brief JSON capacity for the `/status` document. */
constexpr size_t JsonStatusBuf = 1024;
/** @brief Maximum number of registered config variables in `ConfigStore` metadata table. */
constexpr size_t MaxConfigVars = 32;
/** @brief Maximum NVS key length (without null terminator) enforced by `ConfigTypes::NVS_KEY`. */
constexpr size_t MaxNvsKeyLen = 15;
/** @brief FreeRTOS log queue length used by `LogHub` (`LogHubModule::init`). */
constexpr uint8_t LogQueueLen = 32;
/** @brief Console line buffer in `main.cpp`. */
constexpr size_t ConsoleLineBuf = 256;

/** @brief Activity scheduling defaults. */
namespace Activity {
/** @brief Idle delay between two `Activity::step` calls on target. */
constexpr uint32_t IdleMs = 25;
/** @brief Stack size of a polling or simulation task. */
constexpr uint16_t TaskStackSize = 4096;
/** @brief Bounded wait for activities to observe shutdown before restart. */
constexpr uint32_t DrainTimeoutMs = 5000;
}  // namespace Activity

/** @brief Button driver limits. */
namespace Button {
constexpr uint8_t EdgeQueueLen = 16;
constexpr uint16_t TaskStackSize = 3072;
}  // namespace Button

/** @brief MQTT-specific limits grouped by concern to keep `SystemLimits` readable. */
namespace Mqtt {

/** @brief MQTT module task stack size returned by `MqttBusModule::taskStackSize`. */
constexpr uint16_t TaskStackSize = 6144;

/** @brief MQTT static capacities (queues, tables). */
namespace Capacity {
/** @brief FreeRTOS RX queue length for inbound MQTT messages in `MqttBusModule`. */
constexpr uint8_t RxQueueLen = 8;
/** @brief Maximum number of topic subscriptions held by `MqttBusModule`. */
constexpr uint8_t MaxSubscriptions = 12;
}  // namespace Capacity

/** @brief MQTT default configuration values. */
namespace Defaults {
constexpr int32_t Port = 1883;
constexpr char Host[] = "otto";
}  // namespace Defaults

/** @brief MQTT string/payload buffer sizes. */
namespace Buffers {
constexpr size_t Host = 64;
constexpr size_t User = 32;
constexpr size_t Pass = 32;
constexpr size_t ClientId = 32;
constexpr size_t RxTopic = 64;
constexpr size_t RxPayload = 256;
}  // namespace Buffers

/** @brief MQTT timing values. */
namespace Timing {
/** @brief Connect wait before `connect()` reports failure. */
constexpr uint32_t ConnectTimeoutMs = 15000;
constexpr uint32_t ReconnectMinMs = 2000;
constexpr uint32_t ReconnectMaxMs = 60000;
}  // namespace Timing

}  // namespace Mqtt

/** @brief WiFi limits. */
namespace Wifi {
constexpr size_t Ssid = 33;
constexpr size_t Pass = 65;
constexpr uint32_t RetryMs = 10000;
constexpr uint32_t ConnectTimeoutMs = 15000;
constexpr uint32_t RetryPauseMs = 5000;
constexpr uint16_t TaskStackSize = 3072;
}  // namespace Wifi

}  // namespace Limits
