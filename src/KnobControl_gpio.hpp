#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <mutex>

#include <driver/gpio.h>
#include <esp_attr.h>
#include <esp_err.h>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/task.h>

namespace kc {

enum class PinLevel : uint8_t {
    Low = 0,
    High = 1,
};

/**
 * \brief Called after an edge of pin.
 *
 * level and partnerLevel were sampled together when the edge happened, partnerLevel
 * is Low if the handler was registered without a partner pin.
 */
typedef std::function<void(gpio_num_t pin, PinLevel level, PinLevel partnerLevel)> EdgeHandler;

/**
 * \brief The pin capabilities the encoder needs.
 *
 * Edge handlers are never called from an interrupt: the implementation
 * delivers them from a task context, one notification at a time.
 */
class Gpio {
public:
    virtual ~Gpio() {}

    virtual esp_err_t configureInput(gpio_num_t pin, gpio_pull_mode_t pull) = 0;
    virtual PinLevel readLevel(gpio_num_t pin) = 0;

    virtual bool isClaimed(gpio_num_t pin) = 0; //!< An edge handler is registered on the pin

    /**
     * \brief Call handler on every edge (rising and falling) of the pin.
     *
     * Only one handler per pin, registering a second one fails with ESP_ERR_INVALID_STATE.
     * If partner is a valid pin, its level is sampled together with the level of pin.
     */
    virtual esp_err_t registerEdgeCallback(gpio_num_t pin, EdgeHandler handler, gpio_num_t partner = GPIO_NUM_NC) = 0;

    /**
     * \brief Stop notifying about edges of the pin.
     *
     * When this returns, the handler is not running and will not be called again.
     * Edges that happened before this call are never delivered to a handler
     * registered on the pin later.
     */
    virtual esp_err_t deregisterEdgeCallback(gpio_num_t pin) = 0;

    virtual esp_err_t resetPin(gpio_num_t pin) = 0; //!< Return the pin to its power-on state
};

/**
 * \brief Gpio backed by the ESP-IDF GPIO driver.
 *
 * The ISR only reads the pin level and queues it, the handlers run in the
 * "kc_gpio_loop" task. If the task falls behind and the queue fills up,
 * further edges are dropped and reported as a warning.
 */
class EspGpio : public Gpio {
public:
    EspGpio(EspGpio const&) = delete;
    void operator=(EspGpio const&) = delete;

    static EspGpio& get() {
        static EspGpio instance;
        return instance;
    }

    esp_err_t configureInput(gpio_num_t pin, gpio_pull_mode_t pull) override;
    PinLevel readLevel(gpio_num_t pin) override;
    bool isClaimed(gpio_num_t pin) override;
    esp_err_t registerEdgeCallback(gpio_num_t pin, EdgeHandler handler, gpio_num_t partner = GPIO_NUM_NC) override;
    esp_err_t deregisterEdgeCallback(gpio_num_t pin) override;
    esp_err_t resetPin(gpio_num_t pin) override;

    uint32_t droppedEdges() const { return m_dropped.load(); } //!< Edges lost because the queue was full

private:
    EspGpio();
    ~EspGpio();

    struct Event {
        gpio_num_t pin;
        uint8_t level;
        uint8_t partnerLevel;
        uint32_t generation;
    };

    struct Slot {
        EspGpio* self;
        gpio_num_t pin;
        gpio_num_t partner;
        uint32_t generation; //!< Bumped on every registration, stale events are dropped
    };

    esp_err_t installLocked();

    static void IRAM_ATTR isrGpio(void* cookie);
    static void consumerRoutineTrampoline(void* cookie);
    void consumerRoutine();

    QueueHandle_t m_queue;
    std::atomic<uint32_t> m_dropped;

    std::mutex m_mutex;
    std::recursive_mutex m_deliver_mutex;
    std::map<gpio_num_t, EdgeHandler> m_handlers;
    Slot m_slots[GPIO_NUM_MAX];
};

} // namespace kc
