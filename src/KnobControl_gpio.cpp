#include <esp_log.h>

#include "KnobControl_gpio.hpp"

#define TAG "KcGpio"

#define ESP_INTR_FLAG_DEFAULT 0

#ifndef KC_GPIO_QUEUE_LENGTH
#define KC_GPIO_QUEUE_LENGTH 32
#endif

#ifndef KC_GPIO_TASK_STACK_SIZE
#define KC_GPIO_TASK_STACK_SIZE 3072
#endif

#ifndef KC_GPIO_TASK_PRIORITY
#define KC_GPIO_TASK_PRIORITY 10
#endif

namespace kc {

EspGpio::EspGpio()
    : m_queue(nullptr)
    , m_dropped(0) {
    for (int i = 0; i < GPIO_NUM_MAX; ++i) {
        m_slots[i].self = this;
        m_slots[i].pin = gpio_num_t(i);
        m_slots[i].partner = GPIO_NUM_NC;
        m_slots[i].generation = 0;
    }
}

EspGpio::~EspGpio() {
}

esp_err_t EspGpio::installLocked() {
    if (m_queue)
        return ESP_OK;

    // Another driver may have installed the service already.
    const auto err = gpio_install_isr_service(ESP_INTR_FLAG_DEFAULT);
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
        ESP_LOGE(TAG, "failed to install the GPIO ISR service: %s", esp_err_to_name(err));
        return err;
    }

    m_queue = xQueueCreate(KC_GPIO_QUEUE_LENGTH, sizeof(struct Event));
    if (!m_queue)
        return ESP_ERR_NO_MEM;

    if (xTaskCreate(&EspGpio::consumerRoutineTrampoline, "kc_gpio_loop",
            KC_GPIO_TASK_STACK_SIZE, this, KC_GPIO_TASK_PRIORITY, nullptr)
        != pdPASS) {
        vQueueDelete(m_queue);
        m_queue = nullptr;
        return ESP_ERR_NO_MEM;
    }
    return ESP_OK;
}

esp_err_t EspGpio::configureInput(gpio_num_t pin, gpio_pull_mode_t pull) {
    if (!GPIO_IS_VALID_GPIO(pin)) {
        ESP_LOGE(TAG, "invalid input pin %d", (int)pin);
        return ESP_ERR_INVALID_ARG;
    }

    gpio_config_t io_conf = {};
    io_conf.intr_type = GPIO_INTR_DISABLE;
    io_conf.pin_bit_mask = (1ULL << pin);
    io_conf.mode = GPIO_MODE_INPUT;
    io_conf.pull_up_en = (pull == GPIO_PULLUP_ONLY || pull == GPIO_PULLUP_PULLDOWN)
        ? GPIO_PULLUP_ENABLE
        : GPIO_PULLUP_DISABLE;
    io_conf.pull_down_en = (pull == GPIO_PULLDOWN_ONLY || pull == GPIO_PULLUP_PULLDOWN)
        ? GPIO_PULLDOWN_ENABLE
        : GPIO_PULLDOWN_DISABLE;
    return gpio_config(&io_conf);
}

PinLevel EspGpio::readLevel(gpio_num_t pin) {
    return gpio_get_level(pin) ? PinLevel::High : PinLevel::Low;
}

bool EspGpio::isClaimed(gpio_num_t pin) {
    std::lock_guard<std::mutex> l(m_mutex);
    return m_handlers.count(pin) != 0;
}

esp_err_t EspGpio::registerEdgeCallback(gpio_num_t pin, EdgeHandler handler, gpio_num_t partner) {
    if (!GPIO_IS_VALID_GPIO(pin) || !handler)
        return ESP_ERR_INVALID_ARG;
    if (partner != GPIO_NUM_NC && (!GPIO_IS_VALID_GPIO(partner) || partner == pin))
        return ESP_ERR_INVALID_ARG;

    std::lock_guard<std::mutex> l(m_mutex);
    if (m_handlers.count(pin) != 0)
        return ESP_ERR_INVALID_STATE;

    auto err = installLocked();
    if (err != ESP_OK)
        return err;

    m_handlers[pin] = std::move(handler);
    m_slots[pin].partner = partner;
    ++m_slots[pin].generation;

    err = gpio_set_intr_type(pin, GPIO_INTR_ANYEDGE);
    if (err == ESP_OK)
        err = gpio_isr_handler_add(pin, isrGpio, &m_slots[pin]);
    if (err == ESP_OK)
        err = gpio_intr_enable(pin);

    if (err != ESP_OK) {
        ESP_LOGE(TAG, "failed to arm edge interrupt on pin %d: %s", (int)pin, esp_err_to_name(err));
        gpio_isr_handler_remove(pin);
        m_handlers.erase(pin);
    }
    return err;
}

esp_err_t EspGpio::deregisterEdgeCallback(gpio_num_t pin) {
    esp_err_t err = ESP_OK;
    {
        std::lock_guard<std::mutex> l(m_mutex);
        if (m_handlers.erase(pin) == 0)
            return ESP_ERR_NOT_FOUND;

        err = gpio_intr_disable(pin);
        const auto removeErr = gpio_isr_handler_remove(pin);
        if (err == ESP_OK)
            err = removeErr;
    }

    // Wait for a handler that is being delivered right now.
    std::lock_guard<std::recursive_mutex> d(m_deliver_mutex);
    return err;
}

esp_err_t EspGpio::resetPin(gpio_num_t pin) {
    return gpio_reset_pin(pin);
}

void IRAM_ATTR EspGpio::isrGpio(void* cookie) {
    auto& slot = *((Slot*)cookie);
    const Event ev = {
        .pin = slot.pin,
        .level = (uint8_t)gpio_get_level(slot.pin),
        .partnerLevel = (uint8_t)(slot.partner != GPIO_NUM_NC ? gpio_get_level(slot.partner) : 0),
        .generation = slot.generation,
    };

    BaseType_t woken = pdFALSE;
    if (xQueueSendToBackFromISR(slot.self->m_queue, &ev, &woken) != pdTRUE) {
        slot.self->m_dropped.fetch_add(1);
    }
    if (woken == pdTRUE) {
        portYIELD_FROM_ISR();
    }
}

void EspGpio::consumerRoutineTrampoline(void* cookie) {
    ((EspGpio*)cookie)->consumerRoutine();
}

void EspGpio::consumerRoutine() {
    struct Event ev;
    uint32_t reported = 0;
    while (true) {
        if (xQueueReceive(m_queue, &ev, portMAX_DELAY) != pdTRUE)
            continue;

        const auto dropped = m_dropped.load();
        if (dropped != reported) {
            ESP_LOGW(TAG, "notification queue full, %u edges dropped so far", (unsigned)dropped);
            reported = dropped;
        }

        std::lock_guard<std::recursive_mutex> d(m_deliver_mutex);
        EdgeHandler handler;
        m_mutex.lock();
        auto itr = m_handlers.find(ev.pin);
        if (itr != m_handlers.end() && m_slots[ev.pin].generation == ev.generation)
            handler = itr->second;
        m_mutex.unlock();

        if (handler) {
            handler(ev.pin, ev.level ? PinLevel::High : PinLevel::Low,
                ev.partnerLevel ? PinLevel::High : PinLevel::Low);
        }
    }
}

} // namespace kc
