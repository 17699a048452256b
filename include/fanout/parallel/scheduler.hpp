#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace fanout {
namespace parallel {

// Number of threads the host can usefully run, never less than one
inline auto hardware_threads() -> std::size_t {
    return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

// =============================================================================
// Thread pool: fixed set of execution contexts, drained on destruction
// =============================================================================

class thread_pool_t {
public:
    explicit thread_pool_t(std::size_t num_threads) {
        _workers.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            _workers.emplace_back([this] { worker_loop(); });
        }
    }

    thread_pool_t(const thread_pool_t&) = delete;
    thread_pool_t& operator=(const thread_pool_t&) = delete;

    ~thread_pool_t() {
        {
            std::unique_lock<std::mutex> lock(_mutex);
            _stop = true;
        }
        _cv.notify_all();
        for (auto& worker : _workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    auto num_threads() const -> std::size_t { return _workers.size(); }

    // Tasks must not throw; a lane reports its failure through its result
    template<typename F>
    void spawn(F&& task) {
        {
            std::unique_lock<std::mutex> lock(_mutex);
            auto shared_task = std::make_shared<std::decay_t<F>>(std::forward<F>(task));
            _tasks.push([shared_task]() mutable { (*shared_task)(); });
        }
        _cv.notify_one();
    }

private:
    void worker_loop() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(_mutex);
                _cv.wait(lock, [this] {
                    return _stop || !_tasks.empty();
                });
                if (_stop && _tasks.empty()) {
                    return;
                }
                task = std::move(_tasks.front());
                _tasks.pop();
            }
            task();
        }
    }

    std::vector<std::thread> _workers;
    std::queue<std::function<void()>> _tasks;
    std::mutex _mutex;
    std::condition_variable _cv;
    bool _stop = false;
};

} // namespace parallel
} // namespace fanout
