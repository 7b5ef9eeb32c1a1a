#pragma once

#include <functional>

#include <esp_err.h>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/semphr.h>
#include <freertos/task.h>

#ifndef KC_WORKER_QUEUE_LENGTH
#define KC_WORKER_QUEUE_LENGTH 64
#endif

namespace kc {

/**
 * \brief A task that runs queued jobs one at a time, in the order they were posted.
 *
 * The queue is bounded: post() blocks while it is full, jobs are never dropped.
 */
class CallbackWorker {
public:
    CallbackWorker(const char* name, UBaseType_t queueLength = KC_WORKER_QUEUE_LENGTH);
    CallbackWorker(const CallbackWorker&) = delete;
    ~CallbackWorker();

    esp_err_t start();

    void post(std::function<void()> job);

    /**
     * \brief Block until every job posted before this call has finished.
     */
    void flush();

    /**
     * \brief Run the remaining jobs, then end the task. Blocks until it is done.
     */
    void stop();

    bool running() const { return m_queue != nullptr; }
    const char* name() const { return m_name; }

    /**
     * \brief Get the process-wide worker, starting it on first use.
     *
     * Every successful call must be paired with releaseGlobal(). The worker
     * is stopped when the last reference goes away.
     *
     * \return the shared worker or nullptr if it could not be started.
     */
    static CallbackWorker* acquireGlobal(UBaseType_t queueLength = KC_WORKER_QUEUE_LENGTH);
    static void releaseGlobal();
    static int globalRefCount();

private:
    struct Job {
        std::function<void()> fn;
        SemaphoreHandle_t done;
        bool quit;
    };

    void postJob(Job* job);

    static void workerRoutineTrampoline(void* cookie);
    void workerRoutine();

    const char* m_name;
    UBaseType_t m_queue_length;
    QueueHandle_t m_queue;
    SemaphoreHandle_t m_stopped;
};

} // namespace kc
