#pragma once
/**
 * @file ButtonInput.h
 * @brief Push button on a GPIO, reported as debounced edges.
 *
 * The interrupt only queues the raw level change. A dedicated task
 * debounces it and runs the registered handlers, so handlers may publish.
 */

#include "Core/SystemLimits.h"
#include "Modules/Devices/Engine/Device.h"
#include "Modules/Devices/Engine/EdgeHandlerTable.h"
#include "Modules/Devices/Drivers/GpioDriver.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/task.h"

class ButtonInput : public InputDevice {
public:
    ButtonInput(const char* name, uint8_t pin);

    ErrorCode begin() override;
    int8_t registerEdgeHandler(EdgeHandlerFn fn, void* ctx) override { return handlers_.add(fn, ctx); }
    bool unregisterEdgeHandler(int8_t id) override { return handlers_.remove(id); }

private:
    static constexpr uint32_t kDebounceMs = 30;

    static void isr_(void* arg);
    static void taskEntry_(void* arg);
    void run_();

    GpioDriver gpio_;
    EdgeHandlerTable handlers_;
    QueueHandle_t edgeQ_ = nullptr;
    TaskHandle_t task_ = nullptr;
    bool pressed_ = false;
};
