#pragma once
/**
 * @file RelayActuator.h
 * @brief Pump relay driven by a digital output.
 *
 * Accepted payloads: `on`, `1`, `true` energize the relay; `off`, `0`,
 * `false` release it. Matching is case-insensitive and ignores surrounding
 * whitespace.
 */

#include "Modules/Devices/Engine/Device.h"
#include "Modules/Devices/Engine/PinDriver.h"

class RelayActuator : public ActuatorDevice {
public:
    RelayActuator(const char* name, IDigitalPinDriver* pin) : ActuatorDevice(name), pin_(pin) {}

    ErrorCode begin() override;
    ErrorCode handleMessage(const char* payload, size_t len) override;

    bool isOn() const { return on_; }

    /** @brief Parse a relay payload. Returns false when the payload is not a state. */
    static bool parseState(const char* payload, size_t len, bool& on);

private:
    IDigitalPinDriver* pin_ = nullptr;
    volatile bool on_ = false;
};
