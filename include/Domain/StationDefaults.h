#pragma once

#include <stdint.h>

namespace StationDefaults {

constexpr char StationName[] = "gardener";

constexpr uint32_t SoilPollMs = 10000;
constexpr uint32_t EnvPollMs = 10000;

/** @brief Mock mode drift applied to the synthetic soil value. */
constexpr uint32_t SimulationMs = 5000;
constexpr float SimulationDelta = 0.02f;
constexpr float SimulationStart = 0.0f;

/** @brief Fixed reading reported by the mock environmental sensor. */
constexpr float MockTemperatureC = 21.5f;
constexpr float MockHumidityPct = 48.0f;
constexpr float MockPressureHpa = 1013.25f;

constexpr uint8_t LcdCols = 16;
constexpr uint8_t LcdRows = 2;

}  // namespace StationDefaults

namespace DeviceNames {

constexpr char ButtonOn[] = "on";
constexpr char ButtonOff[] = "off";
constexpr char Pump[] = "pump";
constexpr char Env[] = "env";
constexpr char Display[] = "lcd";
constexpr char Soil[] = "soil";

}  // namespace DeviceNames
