#pragma once
/**
 * @file I2CBus.h
 * @brief Shared I2C bus with mutex.
 *
 * The environmental sensor and the display sit on the same bus and are
 * driven from different tasks; every transaction holds the lock.
 */

#include <stdint.h>
#include <Wire.h>
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"

class I2CBus {
public:
    bool begin(int sda, int scl, uint32_t frequencyHz = 100000);

    bool lock(uint32_t timeoutMs);
    void unlock();

    /** @brief Check that a device acknowledges its address. Takes the lock. */
    bool probe(uint8_t addr);

    TwoWire* wire() { return &Wire; }

private:
    SemaphoreHandle_t mutex_ = nullptr;
    bool started_ = false;
};

/** @brief Scoped I2C lock. */
class I2CLock {
public:
    I2CLock(I2CBus& bus, uint32_t timeoutMs) : bus_(bus), held_(bus.lock(timeoutMs)) {}
    ~I2CLock() { if (held_) bus_.unlock(); }

    I2CLock(const I2CLock&) = delete;
    I2CLock& operator=(const I2CLock&) = delete;

    bool held() const { return held_; }

private:
    I2CBus& bus_;
    bool held_;
};
