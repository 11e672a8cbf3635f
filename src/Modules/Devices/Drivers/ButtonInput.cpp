/**
 * @file ButtonInput.cpp
 * @brief Implementation file.
 */

#include "ButtonInput.h"
#include <Arduino.h>

ButtonInput::ButtonInput(const char* name, uint8_t pin)
    : InputDevice(name), gpio_(name, pin, false, false, GpioDriver::PullUp)
{
}

void IRAM_ATTR ButtonInput::isr_(void* arg)
{
    ButtonInput* self = static_cast<ButtonInput*>(arg);
    uint8_t token = 1;
    BaseType_t woken = pdFALSE;
    xQueueSendFromISR(self->edgeQ_, &token, &woken);
    if (woken == pdTRUE) portYIELD_FROM_ISR();
}

void ButtonInput::taskEntry_(void* arg)
{
    static_cast<ButtonInput*>(arg)->run_();
}

void ButtonInput::run_()
{
    uint8_t token = 0;
    while (true) {
        if (xQueueReceive(edgeQ_, &token, portMAX_DELAY) != pdTRUE) continue;

        vTaskDelay(pdMS_TO_TICKS(kDebounceMs));
        while (xQueueReceive(edgeQ_, &token, 0) == pdTRUE) {}

        bool pressed = false;
        if (!gpio_.read(pressed) || pressed == pressed_) continue;
        pressed_ = pressed;
        handlers_.notify(*this, pressed ? EdgeType::Rising : EdgeType::Falling);
    }
}

ErrorCode ButtonInput::begin()
{
    if (task_) return ErrorCode::None;
    if (!gpio_.begin()) return ErrorCode::InvalidArg;
    if (digitalPinToInterrupt(gpio_.pin()) < 0) return ErrorCode::Unsupported;

    if (!gpio_.read(pressed_)) return ErrorCode::IoError;

    edgeQ_ = xQueueCreate(Limits::Button::EdgeQueueLen, sizeof(uint8_t));
    if (!edgeQ_) return ErrorCode::InitFailed;

    if (xTaskCreatePinnedToCore(taskEntry_, name(), Limits::Button::TaskStackSize,
                                this, 2, &task_, 1) != pdPASS) {
        vQueueDelete(edgeQ_);
        edgeQ_ = nullptr;
        return ErrorCode::InitFailed;
    }

    attachInterruptArg(digitalPinToInterrupt(gpio_.pin()), isr_, this, CHANGE);
    return ErrorCode::None;
}
