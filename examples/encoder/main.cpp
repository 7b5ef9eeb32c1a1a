#include <atomic>
#include <esp_log.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

#include "KnobControl_encoder.hpp"

#define TAG "KnobExample"

// KY-040 module: CLK on IO18, DT on IO19, SW on IO21.
extern "C" void app_main() {
    std::atomic<int> position(0);

    kc::RotaryEncoderConfig cfg;
    cfg.clkPin = GPIO_NUM_18;
    cfg.dtPin = GPIO_NUM_19;
    cfg.buttonPin = GPIO_NUM_21;
    cfg.edgesPerEvent = 2;
    cfg.onClockwiseTurn = [&]() { ESP_LOGI(TAG, "position %d", ++position); };
    cfg.onCounterClockwiseTurn = [&]() { ESP_LOGI(TAG, "position %d", --position); };
    cfg.onButtonDown = [&]() { position = 0; };
    cfg.onButtonUp = [&]() { ESP_LOGI(TAG, "position reset"); };

    kc::RotaryEncoder encoder(kc::EspGpio::get(), std::move(cfg));
    ESP_ERROR_CHECK(encoder.install());

    while (true) {
        vTaskDelay(pdMS_TO_TICKS(10000));
        ESP_LOGI(TAG, "still at %d, %u edges dropped", position.load(),
            (unsigned)kc::EspGpio::get().droppedEdges());
    }
}
