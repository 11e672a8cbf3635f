#pragma once

#include <stdint.h>

#ifndef BOARD_REV
#define BOARD_REV 1
#endif

namespace Board {

#if BOARD_REV == 1
namespace DO {
constexpr uint8_t PumpRelay = 5;
}  // namespace DO

namespace DI {
constexpr uint8_t ButtonOn = 17;
constexpr uint8_t ButtonOff = 27;
}  // namespace DI

namespace AI {
/** @brief VH400 soil probe output (ADC1). */
constexpr uint8_t Soil = 34;
}  // namespace AI

namespace I2C {
constexpr uint8_t Sda = 21;
constexpr uint8_t Scl = 22;
constexpr uint8_t Bme280Addr = 0x76;
constexpr uint8_t LcdAddr = 0x27;
}  // namespace I2C
#else
#error "Unsupported BOARD_REV value"
#endif

}  // namespace Board
