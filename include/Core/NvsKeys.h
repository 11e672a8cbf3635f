#pragma once
/**
 * @file NvsKeys.h
 * @brief Centralized NVS key constants used by ConfigStore-registered variables.
 */

namespace NvsKeys {

/** @brief Preferences namespace opened at boot (`main.cpp`). */
constexpr char StorageNamespace[] = "gardenio";

namespace Wifi {
constexpr char Ssid[] = "wifi_ssid";
constexpr char Pass[] = "wifi_pass";
}  // namespace Wifi

namespace Mqtt {
constexpr char Host[] = "mq_host";
constexpr char Port[] = "mq_port";
constexpr char User[] = "mq_user";
constexpr char Pass[] = "mq_pass";
}  // namespace Mqtt

namespace Station {
constexpr char Name[] = "st_name";
constexpr char Mock[] = "st_mock";
constexpr char SoilMs[] = "st_soil_ms";
constexpr char EnvMs[] = "st_env_ms";
constexpr char SimMs[] = "st_sim_ms";
constexpr char SimDelta[] = "st_sim_dlt";
constexpr char LogLevel[] = "st_loglvl";
}  // namespace Station

}  // namespace NvsKeys
