#include <atomic>
#include <memory>
#include <mutex>
#include <stdlib.h>

#include <esp_log.h>

#include "KnobControl_worker.hpp"

#define TAG "KcWorker"

#ifndef KC_WORKER_STACK_SIZE
#define KC_WORKER_STACK_SIZE 4096
#endif

#ifndef KC_WORKER_PRIORITY
#define KC_WORKER_PRIORITY 5
#endif

namespace kc {

static std::mutex s_global_mutex;
static std::unique_ptr<CallbackWorker> s_global;
static int s_global_refs = 0;

CallbackWorker::CallbackWorker(const char* name, UBaseType_t queueLength)
    : m_name(name)
    , m_queue_length(queueLength > 0 ? queueLength : 1)
    , m_queue(nullptr)
    , m_stopped(nullptr) {
}

CallbackWorker::~CallbackWorker() {
    if (m_queue)
        stop();
}

esp_err_t CallbackWorker::start() {
    if (m_queue) {
        ESP_LOGE(TAG, "worker %s is already running", m_name);
        return ESP_ERR_INVALID_STATE;
    }

    m_queue = xQueueCreate(m_queue_length, sizeof(Job*));
    m_stopped = xSemaphoreCreateBinary();
    if (!m_queue || !m_stopped) {
        if (m_queue)
            vQueueDelete(m_queue);
        if (m_stopped)
            vSemaphoreDelete(m_stopped);
        m_queue = nullptr;
        m_stopped = nullptr;
        return ESP_ERR_NO_MEM;
    }

    if (xTaskCreate(&CallbackWorker::workerRoutineTrampoline, m_name,
            KC_WORKER_STACK_SIZE, this, KC_WORKER_PRIORITY, nullptr)
        != pdPASS) {
        ESP_LOGE(TAG, "failed to create worker task %s", m_name);
        vQueueDelete(m_queue);
        vSemaphoreDelete(m_stopped);
        m_queue = nullptr;
        m_stopped = nullptr;
        return ESP_ERR_NO_MEM;
    }

    ESP_LOGD(TAG, "worker %s started", m_name);
    return ESP_OK;
}

void CallbackWorker::postJob(Job* job) {
    xQueueSendToBack(m_queue, &job, portMAX_DELAY);
}

void CallbackWorker::post(std::function<void()> job) {
    postJob(new Job { std::move(job), nullptr, false });
}

void CallbackWorker::flush() {
    // The fence runs after every job posted before it has returned.
    std::atomic<bool> reached(false);
    SemaphoreHandle_t done = xSemaphoreCreateBinary();
    postJob(new Job { [&reached]() { reached = true; }, done, false });

    if (done) {
        xSemaphoreTake(done, portMAX_DELAY);
        vSemaphoreDelete(done);
        return;
    }

    ESP_LOGW(TAG, "no memory for a flush semaphore, polling %s instead", m_name);
    while (!reached.load())
        vTaskDelay(1);
}

void CallbackWorker::stop() {
    if (!m_queue) {
        ESP_LOGE(TAG, "worker %s is not running", m_name);
        return;
    }

    postJob(new Job { nullptr, nullptr, true });
    xSemaphoreTake(m_stopped, portMAX_DELAY);

    vQueueDelete(m_queue);
    vSemaphoreDelete(m_stopped);
    m_queue = nullptr;
    m_stopped = nullptr;
    ESP_LOGD(TAG, "worker %s stopped", m_name);
}

void CallbackWorker::workerRoutineTrampoline(void* cookie) {
    ((CallbackWorker*)cookie)->workerRoutine();
    vTaskDelete(nullptr);
}

void CallbackWorker::workerRoutine() {
    Job* job = nullptr;
    while (true) {
        if (xQueueReceive(m_queue, &job, portMAX_DELAY) != pdTRUE)
            continue;

        std::unique_ptr<Job> owned(job);
        if (owned->fn)
            owned->fn();
        if (owned->done)
            xSemaphoreGive(owned->done);

        if (owned->quit) {
            xSemaphoreGive(m_stopped);
            return;
        }
    }
}

CallbackWorker* CallbackWorker::acquireGlobal(UBaseType_t queueLength) {
    std::lock_guard<std::mutex> l(s_global_mutex);
    if (!s_global) {
        std::unique_ptr<CallbackWorker> worker(new CallbackWorker("kc_global_cb", queueLength));
        if (worker->start() != ESP_OK)
            return nullptr;
        s_global = std::move(worker);
        ESP_LOGI(TAG, "global callback worker started");
    }
    ++s_global_refs;
    return s_global.get();
}

void CallbackWorker::releaseGlobal() {
    std::lock_guard<std::mutex> l(s_global_mutex);
    if (s_global_refs <= 0) {
        ESP_LOGE(TAG, "releaseGlobal() called without a matching acquireGlobal()");
        abort();
    }

    if (--s_global_refs == 0) {
        s_global->stop();
        s_global.reset();
        ESP_LOGI(TAG, "global callback worker stopped");
    }
}

int CallbackWorker::globalRefCount() {
    std::lock_guard<std::mutex> l(s_global_mutex);
    return s_global_refs;
}

} // namespace kc
