#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>

#include <esp_err.h>

#include "KnobControl_worker.hpp"

namespace kc {

typedef std::function<void()> Callback;

/**
 * \brief Called when a user callback fails.
 *
 * \param callbackName name of the failed callback, e.g. "onClockwiseTurn"
 * \param what description of the failure
 */
typedef std::function<void(const char* callbackName, const char* what)> ErrorHook;

//! Where the user callbacks of an encoder run.
enum class CallbackHandling : uint8_t {
    GlobalWorker, //!< One task shared by all encoders, every callback runs in the order it was queued.
    LocalWorker, //!< One task per encoder, ordered per encoder only.
    SpawnPerCall, //!< A new task for each call, no ordering, callbacks may run concurrently.
    /**
     * Directly in the GPIO notification task. Slow callbacks delay the
     * decoding of later edges, which get dropped once the notification
     * queue is full. The least safe mode.
     */
    InlineOnNotify,
};

const char* handlingName(CallbackHandling handling);

/**
 * \brief Runs user callbacks according to a CallbackHandling mode.
 *
 * Every callback runs inside an error boundary: exceptions are caught,
 * logged and handed to the ErrorHook, the next callbacks run normally.
 */
class Dispatcher {
public:
    static std::unique_ptr<Dispatcher> create(CallbackHandling handling, ErrorHook onError,
        UBaseType_t queueLength = KC_WORKER_QUEUE_LENGTH);

    virtual ~Dispatcher() {}

    CallbackHandling handling() const { return m_handling; }

    virtual esp_err_t start() = 0;

    /**
     * \brief Schedule callback.
     *
     * The callback is referenced, not copied, it has to stay alive until release() returns.
     */
    virtual void dispatch(const Callback& callback, const char* name) = 0;

    /**
     * \brief Wait for all dispatched callbacks to finish and free the execution context.
     */
    virtual void release() = 0;

protected:
    Dispatcher(CallbackHandling handling, ErrorHook onError);

    void invoke(const Callback& callback, const char* name);

private:
    void reportFailure(const char* name, const char* what);

    const CallbackHandling m_handling;
    ErrorHook m_on_error;
};

/// @private
class InlineDispatcher : public Dispatcher {
public:
    InlineDispatcher(ErrorHook onError);

    esp_err_t start() override;
    void dispatch(const Callback& callback, const char* name) override;
    void release() override;
};

/// @private
class LocalWorkerDispatcher : public Dispatcher {
public:
    LocalWorkerDispatcher(ErrorHook onError, UBaseType_t queueLength);

    esp_err_t start() override;
    void dispatch(const Callback& callback, const char* name) override;
    void release() override;

private:
    CallbackWorker m_worker;
};

/// @private
class GlobalWorkerDispatcher : public Dispatcher {
public:
    GlobalWorkerDispatcher(ErrorHook onError, UBaseType_t queueLength);
    ~GlobalWorkerDispatcher();

    esp_err_t start() override;
    void dispatch(const Callback& callback, const char* name) override;
    void release() override;

private:
    UBaseType_t m_queue_length;
    CallbackWorker* m_worker;
};

/// @private
class SpawnDispatcher : public Dispatcher {
public:
    SpawnDispatcher(ErrorHook onError);

    esp_err_t start() override;
    void dispatch(const Callback& callback, const char* name) override;
    void release() override;

    int inFlight();

private:
    struct SpawnArgs {
        SpawnDispatcher* self;
        const Callback* callback;
        const char* name;
    };

    static void spawnRoutineTrampoline(void* cookie);
    void finished();

    std::mutex m_mutex;
    std::condition_variable m_idle;
    int m_in_flight;
};

} // namespace kc
