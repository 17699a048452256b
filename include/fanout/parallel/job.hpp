#pragma once

#include <concepts>
#include <functional>
#include <future>
#include <type_traits>
#include <utility>

namespace fanout {
namespace parallel {

// =============================================================================
// Job concept
// =============================================================================
//
// A job is invoked exactly once. The call starts an asynchronous operation
// and returns a handle for it; the handle is waited on and its value taken
// with get(). Where the operation runs (its own thread, an I/O loop fulfilling
// a promise, ...) is up to the job.

template<typename H>
concept Awaitable = requires(H h) {
    h.wait();
    h.get();
};

template<typename J>
concept Job = std::move_constructible<J>
    && std::invocable<J&>
    && Awaitable<std::invoke_result_t<J&>>;

template<Job J>
using job_handle_t = std::invoke_result_t<J&>;

template<Job J>
using job_output_t = std::decay_t<decltype(std::declval<job_handle_t<J>&>().get())>;

// Type-erased job for heterogeneous work producing T
template<typename T>
using job_t = std::function<std::future<T>()>;

// =============================================================================
// Adapters
// =============================================================================

// Wrap a blocking callable: starting the job runs it on a thread of its own
template<typename F>
    requires std::invocable<F&>
auto async_job(F f) {
    return [f = std::move(f)]() mutable {
        return std::async(std::launch::async, std::move(f));
    };
}

// A job whose value is already known
template<typename T>
auto ready_job(T value) {
    return [value = std::move(value)]() mutable {
        std::promise<T> promise;
        promise.set_value(std::move(value));
        return promise.get_future();
    };
}

} // namespace parallel
} // namespace fanout
