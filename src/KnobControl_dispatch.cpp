#include <exception>
#include <memory>

#include <esp_log.h>

#include "KnobControl_dispatch.hpp"

#define TAG "KcDispatch"

#ifndef KC_SPAWN_STACK_SIZE
#define KC_SPAWN_STACK_SIZE 3072
#endif

#ifndef KC_SPAWN_PRIORITY
#define KC_SPAWN_PRIORITY 5
#endif

namespace kc {

const char* handlingName(CallbackHandling handling) {
    switch (handling) {
    case CallbackHandling::GlobalWorker:
        return "GlobalWorker";
    case CallbackHandling::LocalWorker:
        return "LocalWorker";
    case CallbackHandling::SpawnPerCall:
        return "SpawnPerCall";
    case CallbackHandling::InlineOnNotify:
        return "InlineOnNotify";
    }
    return "?";
}

std::unique_ptr<Dispatcher> Dispatcher::create(CallbackHandling handling, ErrorHook onError,
    UBaseType_t queueLength) {
    switch (handling) {
    case CallbackHandling::GlobalWorker:
        return std::unique_ptr<Dispatcher>(new GlobalWorkerDispatcher(std::move(onError), queueLength));
    case CallbackHandling::LocalWorker:
        return std::unique_ptr<Dispatcher>(new LocalWorkerDispatcher(std::move(onError), queueLength));
    case CallbackHandling::SpawnPerCall:
        return std::unique_ptr<Dispatcher>(new SpawnDispatcher(std::move(onError)));
    case CallbackHandling::InlineOnNotify:
        return std::unique_ptr<Dispatcher>(new InlineDispatcher(std::move(onError)));
    }
    return nullptr;
}

Dispatcher::Dispatcher(CallbackHandling handling, ErrorHook onError)
    : m_handling(handling)
    , m_on_error(std::move(onError)) {
}

void Dispatcher::reportFailure(const char* name, const char* what) {
    ESP_LOGE(TAG, "callback %s failed: %s", name, what);
    if (m_on_error)
        m_on_error(name, what);
}

void Dispatcher::invoke(const Callback& callback, const char* name) {
#if __cpp_exceptions
    try {
        callback();
    } catch (const std::exception& e) {
        reportFailure(name, e.what());
    } catch (...) {
        reportFailure(name, "unknown exception");
    }
#else
    callback();
#endif
}

InlineDispatcher::InlineDispatcher(ErrorHook onError)
    : Dispatcher(CallbackHandling::InlineOnNotify, std::move(onError)) {
}

esp_err_t InlineDispatcher::start() {
    return ESP_OK;
}

void InlineDispatcher::dispatch(const Callback& callback, const char* name) {
    invoke(callback, name);
}

void InlineDispatcher::release() {
}

LocalWorkerDispatcher::LocalWorkerDispatcher(ErrorHook onError, UBaseType_t queueLength)
    : Dispatcher(CallbackHandling::LocalWorker, std::move(onError))
    , m_worker("kc_local_cb", queueLength) {
}

esp_err_t LocalWorkerDispatcher::start() {
    return m_worker.start();
}

void LocalWorkerDispatcher::dispatch(const Callback& callback, const char* name) {
    m_worker.post([this, &callback, name]() { invoke(callback, name); });
}

void LocalWorkerDispatcher::release() {
    if (m_worker.running())
        m_worker.stop();
}

GlobalWorkerDispatcher::GlobalWorkerDispatcher(ErrorHook onError, UBaseType_t queueLength)
    : Dispatcher(CallbackHandling::GlobalWorker, std::move(onError))
    , m_queue_length(queueLength)
    , m_worker(nullptr) {
}

GlobalWorkerDispatcher::~GlobalWorkerDispatcher() {
    if (m_worker)
        release();
}

esp_err_t GlobalWorkerDispatcher::start() {
    if (m_worker)
        return ESP_ERR_INVALID_STATE;
    m_worker = CallbackWorker::acquireGlobal(m_queue_length);
    return m_worker ? ESP_OK : ESP_ERR_NO_MEM;
}

void GlobalWorkerDispatcher::dispatch(const Callback& callback, const char* name) {
    m_worker->post([this, &callback, name]() { invoke(callback, name); });
}

void GlobalWorkerDispatcher::release() {
    if (!m_worker)
        return;

    // Other encoders keep the worker alive, only wait for our own jobs.
    m_worker->flush();
    m_worker = nullptr;
    CallbackWorker::releaseGlobal();
}

SpawnDispatcher::SpawnDispatcher(ErrorHook onError)
    : Dispatcher(CallbackHandling::SpawnPerCall, std::move(onError))
    , m_in_flight(0) {
}

esp_err_t SpawnDispatcher::start() {
    return ESP_OK;
}

void SpawnDispatcher::dispatch(const Callback& callback, const char* name) {
    m_mutex.lock();
    ++m_in_flight;
    m_mutex.unlock();

    std::unique_ptr<SpawnArgs> args(new SpawnArgs { this, &callback, name });
    if (xTaskCreate(&SpawnDispatcher::spawnRoutineTrampoline, "kc_spawn_cb",
            KC_SPAWN_STACK_SIZE, args.get(), KC_SPAWN_PRIORITY, nullptr)
        != pdPASS) {
        ESP_LOGW(TAG, "failed to spawn a task for %s, running it inline", name);
        args.reset();
        invoke(callback, name);
        finished();
        return;
    }
    args.release(); // owned by the task now
}

void SpawnDispatcher::spawnRoutineTrampoline(void* cookie) {
    std::unique_ptr<SpawnArgs> args((SpawnArgs*)cookie);
    args->self->invoke(*args->callback, args->name);
    args->self->finished();
    args.reset();
    vTaskDelete(nullptr);
}

void SpawnDispatcher::finished() {
    std::lock_guard<std::mutex> l(m_mutex);
    if (--m_in_flight == 0)
        m_idle.notify_all();
}

int SpawnDispatcher::inFlight() {
    std::lock_guard<std::mutex> l(m_mutex);
    return m_in_flight;
}

void SpawnDispatcher::release() {
    std::unique_lock<std::mutex> l(m_mutex);
    m_idle.wait(l, [this]() { return m_in_flight == 0; });
}

} // namespace kc
