#ifndef _RESILIENCE_H_
#define _RESILIENCE_H_

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

#include "config.h"
#include "errors.h"

struct ResilienceOptions
{
    ResilienceOptions() :
        timeout_ms(5000), max_retries(3), backoff_ms(100), enable_fallback(true), log_errors(false)
    {
    }

    // reads the [resilience] section
    void load(const Config& config)
    {
        this->timeout_ms = config.GetIntValue("resilience", "timeout_ms", static_cast<int>(this->timeout_ms));
        this->max_retries = config.GetIntValue("resilience", "max_retries", this->max_retries);
        this->backoff_ms = config.GetIntValue("resilience", "backoff_ms", static_cast<int>(this->backoff_ms));
        this->enable_fallback = config.GetBoolValue("resilience", "enable_fallback", this->enable_fallback);
        this->log_errors = config.GetBoolValue("resilience", "log_errors", this->log_errors);
    }

    long timeout_ms;
    int max_retries;
    long backoff_ms;
    bool enable_fallback;
    bool log_errors;
};

template <typename T>
struct TimeoutState
{
    TimeoutState() :
        done(false), success(false)
    {
    }

    std::mutex mutex;
    std::condition_variable cond;
    bool done;
    bool success;
    T result;
    Error error;
};

// Runs fn on its own thread and waits at most timeout_ms for it.
//
// On timeout the call is abandoned, not stopped: the thread keeps running to
// completion and holds its captures until then. fn is copied into the thread,
// so everything it captures must be owned by value or outlive the call.
template <typename T>
bool with_timeout(long timeout_ms, const std::function<bool(T&, Error&)>& fn, T& result, Error* error)
{
    std::shared_ptr<TimeoutState<T> > state(new TimeoutState<T>());
    std::function<bool(T&, Error&)> work(fn);
    std::thread worker([state, work]()
    {
        T value;
        Error failure;
        bool success = work(value, failure);
        std::lock_guard<std::mutex> guard(state->mutex);
        state->success = success;
        state->result = value;
        state->error = failure;
        state->done = true;
        state->cond.notify_all();
    });
    worker.detach();

    std::unique_lock<std::mutex> lock(state->mutex);
    bool finished = state->cond.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&state]() { return state->done; });
    if (!finished)
    {
        std::ostringstream message;
        message << "operation exceeded " << timeout_ms << "ms";
        return set_error(error, EC_TIMEOUT, message.str());
    }

    if (!state->success)
    {
        if (error != NULL)
        {
            *error = state->error;
        }

        return false;
    }

    result = state->result;
    return true;
}

// Calls fn once plus up to max_retries more times, sleeping
// backoff_ms * 2^attempt between calls. should_retry, when given, decides
// which errors are worth another call. On exhaustion error holds the last
// error, its code kept, with the attempt count added.
template <typename T>
bool with_retry(int max_retries, long backoff_ms, const std::function<bool(T&, Error&)>& fn, T& result, Error* error,
        bool (*should_retry)(const Error&) = NULL)
{
    Error last;
    int attempts = 0;
    for (int attempt = 0; attempt <= max_retries; ++attempt)
    {
        ++attempts;
        last.clear();
        if (fn(result, last))
        {
            return true;
        }

        if (should_retry != NULL && !should_retry(last))
        {
            break;
        }

        if (attempt < max_retries)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms << attempt));
        }
    }

    if (error != NULL)
    {
        std::ostringstream context;
        context << "failed after " << attempts << " attempt" << (attempts > 1 ? "s" : "");
        *error = last.wrap(context.str());
    }

    return false;
}

// Returns fn's result when it succeeds. Otherwise runs fallback, which cannot
// fail, leaves its result in result and fn's error in error and returns false
// so a degraded result can be told apart from a full one.
template <typename T>
bool with_fallback(const std::function<bool(T&, Error&)>& fn, const std::function<void(T&)>& fallback, T& result, Error* error)
{
    Error failure;
    if (fn(result, failure))
    {
        return true;
    }

    fallback(result);
    if (error != NULL)
    {
        *error = failure;
    }

    return false;
}

#endif
