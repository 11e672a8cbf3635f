/**
 * @file I2CBus.cpp
 * @brief Implementation file.
 */

#include "I2CBus.h"

bool I2CBus::begin(int sda, int scl, uint32_t frequencyHz)
{
    if (!mutex_) mutex_ = xSemaphoreCreateMutex();
    if (!mutex_) return false;
    if (!started_) started_ = Wire.begin(sda, scl, frequencyHz);
    return started_;
}

bool I2CBus::lock(uint32_t timeoutMs)
{
    if (!mutex_) return false;
    return xSemaphoreTake(mutex_, pdMS_TO_TICKS(timeoutMs)) == pdTRUE;
}

void I2CBus::unlock()
{
    if (!mutex_) return;
    xSemaphoreGive(mutex_);
}

bool I2CBus::probe(uint8_t addr)
{
    I2CLock guard(*this, 100);
    if (!guard.held()) return false;
    Wire.beginTransmission(addr);
    return Wire.endTransmission() == 0;
}
