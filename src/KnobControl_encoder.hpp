#pragma once

#include <memory>
#include <mutex>

#include <driver/gpio.h>
#include <esp_err.h>

#include "KnobControl_decoder.hpp"
#include "KnobControl_dispatch.hpp"
#include "KnobControl_gpio.hpp"

namespace kc {

enum class ButtonEvent : uint8_t {
    Down,
    Up,
};

/**
 * \brief Everything a RotaryEncoder needs to know about its pins and callbacks.
 */
struct RotaryEncoderConfig {
    gpio_num_t clkPin = GPIO_NUM_NC;
    gpio_num_t dtPin = GPIO_NUM_NC;
    gpio_num_t buttonPin = GPIO_NUM_NC; //!< Optional push button (SW), pressed when low

    Callback onClockwiseTurn;
    Callback onCounterClockwiseTurn;
    Callback onButtonDown;
    Callback onButtonUp;

    CallbackHandling callbackHandling = CallbackHandling::GlobalWorker;
    ErrorHook onCallbackError; //!< Optional, failures are always logged

    uint8_t edgesPerEvent = 4; //!< Quadrature edges per detent: 4 (full cycle), 2 (half cycle) or 1
    bool reversed = false; //!< Swap clockwise and counter-clockwise
    gpio_pull_mode_t pull = GPIO_PULLUP_ONLY;
    UBaseType_t workerQueueLength = KC_WORKER_QUEUE_LENGTH; //!< Used by LocalWorker and by the first GlobalWorker encoder
};

/**
 * \brief A rotary encoder attached to two (or three, with the button) GPIO pins.
 *
 * Typical use:
 * \code
 * kc::RotaryEncoderConfig cfg;
 * cfg.clkPin = GPIO_NUM_18;
 * cfg.dtPin = GPIO_NUM_19;
 * cfg.onClockwiseTurn = [&]() { ++volume; };
 * cfg.onCounterClockwiseTurn = [&]() { --volume; };
 *
 * kc::RotaryEncoder enc(kc::EspGpio::get(), std::move(cfg));
 * ESP_ERROR_CHECK(enc.install());
 * \endcode
 *
 * The encoder is released when it goes out of scope, or earlier by calling release().
 */
class RotaryEncoder {
public:
    RotaryEncoder(Gpio& gpio, RotaryEncoderConfig config);
    RotaryEncoder(const RotaryEncoder&) = delete;
    void operator=(const RotaryEncoder&) = delete;
    ~RotaryEncoder();

    /**
     * \brief Configure the pins, read their initial state and start decoding.
     *
     * On failure nothing stays registered and the encoder can be installed again.
     * Pins used by another encoder are left untouched.
     *
     * \return ESP_OK, ESP_ERR_INVALID_ARG for a bad pin or edgesPerEvent, ESP_ERR_INVALID_STATE
     *         if already installed or a pin is taken, ESP_ERR_NO_MEM if the callback task could not be started,
     *         or the error reported by the Gpio.
     */
    esp_err_t install();

    /**
     * \brief Stop decoding and wait until all queued callbacks have finished.
     *
     * Edge handlers are removed first, then the callback context is drained. Failures
     * of the individual steps are logged and do not stop the remaining ones.
     * Must be called exactly once per successful install(), the destructor calls
     * it if needed.
     */
    void release();

    bool installed() const { return m_installed; }
    const RotaryEncoderConfig& config() const { return m_config; }

    EncoderState state(); //!< Last decoded pin state

private:
    esp_err_t validate() const;
    void rollback(int registered, int configured);

    void onEdge(gpio_num_t pin, PinLevel level, PinLevel partnerLevel);
    void onButtonEdge(PinLevel level);
    void emit(RotationEvent ev);
    void emit(ButtonEvent ev);

    Gpio& m_gpio;
    const RotaryEncoderConfig m_config;

    std::mutex m_decoder_mutex;
    QuadratureDecoder m_decoder;
    PinLevel m_button_level;

    std::unique_ptr<Dispatcher> m_dispatcher;
    bool m_installed;
};

} // namespace kc
