#pragma once
/**
 * @file MqttTopics.h
 * @brief Station topic names. Outbound data uses `d/`, inbound commands use `c/`.
 */

namespace MqttTopics {

/** @brief Prefix of every outbound data topic (`d/<device>`). */
constexpr char DataPrefix[] = "d/";

constexpr char Soil[] = "d/soil";
constexpr char Env[] = "d/env";
constexpr char ButtonOn[] = "d/on";
constexpr char ButtonOff[] = "d/off";

/** @brief Relay command ingress, payload forwarded verbatim to the pump. */
constexpr char CmdPump[] = "c/pump";
/** @brief Display text ingress. */
constexpr char CmdLcd[] = "c/lcd";
/** @brief Termination requests (`stop`, `restart`). */
constexpr char CmdSystem[] = "c/system";

/** @brief Literal payloads published on button edges. */
constexpr char PayloadOn[] = "on";
constexpr char PayloadOff[] = "off";

}  // namespace MqttTopics
