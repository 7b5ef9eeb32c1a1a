#include <stdlib.h>

#include <esp_log.h>

#include "KnobControl_encoder.hpp"

#define TAG "KcEncoder"

namespace kc {

RotaryEncoder::RotaryEncoder(Gpio& gpio, RotaryEncoderConfig config)
    : m_gpio(gpio)
    , m_config(std::move(config))
    , m_decoder(m_config.edgesPerEvent, m_config.reversed)
    , m_button_level(PinLevel::High)
    , m_installed(false) {
}

RotaryEncoder::~RotaryEncoder() {
    if (m_installed)
        release();
}

esp_err_t RotaryEncoder::validate() const {
    const auto clk = m_config.clkPin;
    const auto dt = m_config.dtPin;
    const auto btn = m_config.buttonPin;

    if (clk < 0 || dt < 0 || clk >= GPIO_NUM_MAX || dt >= GPIO_NUM_MAX) {
        ESP_LOGE(TAG, "invalid encoder pins clk %d dt %d", (int)clk, (int)dt);
        return ESP_ERR_INVALID_ARG;
    }
    if (clk == dt) {
        ESP_LOGE(TAG, "clk and dt must be different pins, both are %d", (int)clk);
        return ESP_ERR_INVALID_ARG;
    }
    if (btn != GPIO_NUM_NC && (btn < 0 || btn >= GPIO_NUM_MAX || btn == clk || btn == dt)) {
        ESP_LOGE(TAG, "invalid button pin %d", (int)btn);
        return ESP_ERR_INVALID_ARG;
    }
    if (!QuadratureDecoder::isValidEdgesPerEvent(m_config.edgesPerEvent)) {
        ESP_LOGE(TAG, "unsupported edgesPerEvent %d, use 1, 2 or 4", (int)m_config.edgesPerEvent);
        return ESP_ERR_INVALID_ARG;
    }
    return ESP_OK;
}

esp_err_t RotaryEncoder::install() {
    if (m_installed) {
        ESP_LOGE(TAG, "encoder on pins %d/%d is already installed", (int)m_config.clkPin, (int)m_config.dtPin);
        return ESP_ERR_INVALID_STATE;
    }

    auto err = validate();
    if (err != ESP_OK)
        return err;

    const bool hasButton = m_config.buttonPin != GPIO_NUM_NC;
    const gpio_num_t pins[] = { m_config.clkPin, m_config.dtPin, m_config.buttonPin };
    const int pinCount = hasButton ? 3 : 2;

    // Configuring a pin disarms its interrupt, so check ownership before touching any of them.
    for (int i = 0; i < pinCount; ++i) {
        if (m_gpio.isClaimed(pins[i])) {
            ESP_LOGE(TAG, "pin %d is already used by another handler", (int)pins[i]);
            return ESP_ERR_INVALID_STATE;
        }
    }

    for (int i = 0; i < pinCount; ++i) {
        err = m_gpio.configureInput(pins[i], m_config.pull);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "failed to configure pin %d: %s", (int)pins[i], esp_err_to_name(err));
            rollback(0, i);
            return err;
        }
    }

    // Seed the decoder before any edge can arrive.
    m_decoder_mutex.lock();
    m_decoder.reset(encoderState(m_gpio.readLevel(m_config.clkPin), m_gpio.readLevel(m_config.dtPin)));
    if (hasButton)
        m_button_level = m_gpio.readLevel(m_config.buttonPin);
    m_decoder_mutex.unlock();

    m_dispatcher = Dispatcher::create(m_config.callbackHandling, m_config.onCallbackError,
        m_config.workerQueueLength);
    err = m_dispatcher ? m_dispatcher->start() : ESP_ERR_INVALID_ARG;
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "failed to start %s callback handling: %s",
            handlingName(m_config.callbackHandling), esp_err_to_name(err));
        m_dispatcher.reset();
        rollback(0, pinCount);
        return err;
    }

    for (int i = 0; i < pinCount; ++i) {
        if (i < 2) {
            err = m_gpio.registerEdgeCallback(
                pins[i], [this](gpio_num_t pin, PinLevel level, PinLevel partnerLevel) {
                    onEdge(pin, level, partnerLevel);
                },
                pins[1 - i]);
        } else {
            err = m_gpio.registerEdgeCallback(pins[i], [this](gpio_num_t, PinLevel level, PinLevel) {
                onButtonEdge(level);
            });
        }

        if (err != ESP_OK) {
            ESP_LOGE(TAG, "failed to register edge callback on pin %d: %s", (int)pins[i], esp_err_to_name(err));
            rollback(i, pinCount);
            return err;
        }
    }

    m_installed = true;
    ESP_LOGI(TAG, "encoder installed on clk %d dt %d, state %s, %s",
        (int)m_config.clkPin, (int)m_config.dtPin, stateName(m_decoder.state()),
        handlingName(m_config.callbackHandling));
    return ESP_OK;
}

void RotaryEncoder::rollback(int registered, int configured) {
    const gpio_num_t pins[] = { m_config.clkPin, m_config.dtPin, m_config.buttonPin };

    for (int i = 0; i < registered; ++i) {
        const auto err = m_gpio.deregisterEdgeCallback(pins[i]);
        if (err != ESP_OK)
            ESP_LOGE(TAG, "failed to deregister pin %d: %s", (int)pins[i], esp_err_to_name(err));
    }

    if (m_dispatcher) {
        m_dispatcher->release();
        m_dispatcher.reset();
    }

    for (int i = 0; i < configured; ++i) {
        const auto err = m_gpio.resetPin(pins[i]);
        if (err != ESP_OK)
            ESP_LOGE(TAG, "failed to reset pin %d: %s", (int)pins[i], esp_err_to_name(err));
    }
}

void RotaryEncoder::release() {
    if (!m_installed) {
        ESP_LOGE(TAG, "release() called on encoder %d/%d which is not installed, please make sure to only release it once!",
            (int)m_config.clkPin, (int)m_config.dtPin);
        abort();
    }

    const int pinCount = m_config.buttonPin != GPIO_NUM_NC ? 3 : 2;
    rollback(pinCount, pinCount);
    m_installed = false;
    ESP_LOGI(TAG, "encoder on clk %d dt %d released", (int)m_config.clkPin, (int)m_config.dtPin);
}

EncoderState RotaryEncoder::state() {
    std::lock_guard<std::mutex> l(m_decoder_mutex);
    return m_decoder.state();
}

void RotaryEncoder::onEdge(gpio_num_t pin, PinLevel level, PinLevel partnerLevel) {
    RotationEvent ev = RotationEvent::Clockwise;
    bool emitted;

    m_decoder_mutex.lock();
    const auto clk = pin == m_config.clkPin ? level : partnerLevel;
    const auto dt = pin == m_config.clkPin ? partnerLevel : level;
    const auto prev = m_decoder.state();
    emitted = m_decoder.feed(encoderState(clk, dt), ev);
    ESP_LOGD(TAG, "edge on %d: %s -> %s", (int)pin, stateName(prev), stateName(m_decoder.state()));
    m_decoder_mutex.unlock();

    if (emitted)
        emit(ev);
}

void RotaryEncoder::onButtonEdge(PinLevel level) {
    m_decoder_mutex.lock();
    const bool changed = level != m_button_level;
    m_button_level = level;
    m_decoder_mutex.unlock();

    if (changed)
        emit(level == PinLevel::Low ? ButtonEvent::Down : ButtonEvent::Up);
}

void RotaryEncoder::emit(RotationEvent ev) {
    ESP_LOGD(TAG, "%s turn on %d", eventName(ev), (int)m_config.clkPin);
    if (ev == RotationEvent::Clockwise) {
        if (m_config.onClockwiseTurn)
            m_dispatcher->dispatch(m_config.onClockwiseTurn, "onClockwiseTurn");
    } else {
        if (m_config.onCounterClockwiseTurn)
            m_dispatcher->dispatch(m_config.onCounterClockwiseTurn, "onCounterClockwiseTurn");
    }
}

void RotaryEncoder::emit(ButtonEvent ev) {
    if (ev == ButtonEvent::Down) {
        if (m_config.onButtonDown)
            m_dispatcher->dispatch(m_config.onButtonDown, "onButtonDown");
    } else {
        if (m_config.onButtonUp)
            m_dispatcher->dispatch(m_config.onButtonUp, "onButtonUp");
    }
}

} // namespace kc
