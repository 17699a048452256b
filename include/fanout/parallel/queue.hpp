#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>
#include <vector>

namespace fanout {
namespace parallel {

// =============================================================================
// Blocking queue: multi-producer channel, lane threads report through it
// =============================================================================

template<typename T>
class blocking_queue {
public:
    void send(T item) {
        {
            std::unique_lock<std::mutex> lock(_mutex);
            _queue.push(std::move(item));
        }
        _cv.notify_one();
    }

    T recv() {
        std::unique_lock<std::mutex> lock(_mutex);
        _cv.wait(lock, [this] { return !_queue.empty(); });
        auto item = std::move(_queue.front());
        _queue.pop();
        return item;
    }

    // Block until `count` items have arrived; returned in arrival order
    std::vector<T> recv_n(std::size_t count) {
        std::vector<T> items;
        items.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            items.push_back(recv());
        }
        return items;
    }

    std::optional<T> try_recv() {
        std::unique_lock<std::mutex> lock(_mutex);
        if (_queue.empty()) {
            return std::nullopt;
        }
        auto item = std::move(_queue.front());
        _queue.pop();
        return item;
    }

private:
    std::queue<T> _queue;
    std::mutex _mutex;
    std::condition_variable _cv;
};

} // namespace parallel
} // namespace fanout
