#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "job.hpp"
#include "queue.hpp"
#include "scheduler.hpp"

namespace fanout {
namespace parallel {

// =============================================================================
// Errors
// =============================================================================

// Invalid lane count or batch size; raised before anything runs
class config_error : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// A job failed while its lane was running on a pool thread. The run waits
// for every other lane to finish before this is thrown.
class lane_fault : public std::runtime_error {
public:
    lane_fault(std::size_t lane, std::exception_ptr cause)
        : std::runtime_error("lane " + std::to_string(lane) + " faulted: " + describe(cause))
        , _lane(lane)
        , _cause(std::move(cause)) {}

    auto lane() const -> std::size_t { return _lane; }
    auto cause() const -> std::exception_ptr { return _cause; }

    [[noreturn]] void rethrow_cause() const { std::rethrow_exception(_cause); }

private:
    static auto describe(const std::exception_ptr& cause) -> std::string {
        try {
            std::rethrow_exception(cause);
        } catch (const std::exception& e) {
            return e.what();
        } catch (...) {
            return "non-standard exception";
        }
    }

    std::size_t _lane;
    std::exception_ptr _cause;
};

// =============================================================================
// Chunk plan for the single-threaded strategy
// =============================================================================
//
// Indices into the flattened job list. Everything fits in one chunk when
// total <= batch_size; otherwise there are ceil(total / batch_size) chunks
// and index i goes to chunk i % chunks_count (round-robin, not slicing).

inline auto chunk_plan(std::size_t total, std::size_t batch_size)
    -> std::vector<std::vector<std::size_t>>
{
    if (batch_size == 0) {
        throw config_error("batch size must be at least 1");
    }
    if (total == 0) {
        return {};
    }
    auto chunks_count = total <= batch_size ? std::size_t(1) : (total + batch_size - 1) / batch_size;
    auto chunks = std::vector<std::vector<std::size_t>>(chunks_count);

    for (std::size_t i = 0; i < total; ++i) {
        chunks[i % chunks_count].push_back(i);
    }
    return chunks;
}

namespace detail {

struct no_results_t {};

template<typename R>
struct lane_report_t {
    std::size_t lane;
    R results;
    std::exception_ptr fault;
};

// Lane-major concatenation
template<typename T>
auto concat_lanes(std::vector<std::vector<T>> per_lane) -> std::vector<T> {
    auto all = std::vector<T>{};
    for (auto& lane : per_lane) {
        std::move(lane.begin(), lane.end(), std::back_inserter(all));
    }
    return all;
}

} // namespace detail

// =============================================================================
// worker_t: round-robin lanes of jobs, consumed by exactly one run
// =============================================================================
//
// Job i (counting every push) lands in lane i % lane_count. Run methods are
// rvalue-qualified:
//
//   auto w = worker_t<job_t<int>>(3);
//   for (...) w.push(job);
//   auto results = std::move(w).run_and_collect_results();
//
// Collected results are lane-major: lane 0's outputs in push order, then
// lane 1's, and so on. With more than one lane this is not push order; the
// jobs for L=3, N=7 come back as [0, 3, 6, 1, 4, 2, 5].

template<Job J>
class worker_t {
public:
    using job_type = J;
    using output_type = job_output_t<J>;
    using lanes_type = std::vector<std::vector<J>>;

    worker_t() : worker_t(hardware_threads()) {}

    explicit worker_t(std::size_t lane_count)
        : _lane_count(checked_lane_count(lane_count))
        , _lanes(_lane_count) {}

    static auto with_lanes(std::size_t lane_count) -> worker_t {
        return worker_t(lane_count);
    }

    worker_t(worker_t&& other) noexcept
        : _lane_count(other._lane_count)
        , _pushed(std::exchange(other._pushed, 0))
        , _consumed(std::exchange(other._consumed, true))
        , _lanes(std::move(other._lanes)) {}

    worker_t& operator=(worker_t&& other) noexcept {
        _lane_count = other._lane_count;
        _pushed = std::exchange(other._pushed, 0);
        _consumed = std::exchange(other._consumed, true);
        _lanes = std::move(other._lanes);
        return *this;
    }

    void push(J job) {
        require_live("push");
        _lanes[_pushed % _lane_count].push_back(std::move(job));
        ++_pushed;
    }

    auto lane_count() const -> std::size_t { return _lane_count; }
    auto size() const -> std::size_t { return _pushed; }
    auto consumed() const -> bool { return _consumed; }
    auto lanes() const -> const lanes_type& { return _lanes; }

    // --- Strategies ---

    // One pool thread per lane, jobs awaited one after another
    void run() && {
        drive_lanes<detail::no_results_t>(take("run"), [](std::vector<J>& jobs, detail::no_results_t&) {
            return run_in_order(jobs, [](auto& handle) { handle.get(); });
        });
    }

    // Returns vector<output_type> in lane-major order; absent for void jobs
    auto run_and_collect_results() &&
        requires (!std::is_void_v<output_type>)
    {
        auto per_lane = drive_lanes<std::vector<output_type>>(take("run_and_collect_results"),
            [](std::vector<J>& jobs, std::vector<output_type>& results) {
                return run_in_order(jobs, [&results](auto& handle) { results.push_back(handle.get()); });
            });
        return detail::concat_lanes(std::move(per_lane));
    }

    // One pool thread per lane, all of a lane's jobs started together
    void run_all_joined() && {
        drive_lanes<detail::no_results_t>(take("run_all_joined"), [](std::vector<J>& jobs, detail::no_results_t&) {
            return run_joined(jobs, [](auto& handle) { handle.get(); });
        });
    }

    auto run_all_joined_and_collect_results() &&
        requires (!std::is_void_v<output_type>)
    {
        auto per_lane = drive_lanes<std::vector<output_type>>(take("run_all_joined_and_collect_results"),
            [](std::vector<J>& jobs, std::vector<output_type>& results) {
                return run_joined(jobs, [&results](auto& handle) { results.push_back(handle.get()); });
            });
        return detail::concat_lanes(std::move(per_lane));
    }

    // Calling thread only. Bounds the number of jobs in flight to the chunk
    // size; chunks run one after another. The first failing job is rethrown
    // once its chunk has settled, and later chunks are not started.
    void run_single_threaded(std::optional<std::size_t> batch_size = std::nullopt) && {
        auto plan = chunk_plan(_pushed, batch_size.value_or(_lane_count));
        auto jobs = flatten(take("run_single_threaded"));

        for (auto& chunk : plan) {
            auto batch = std::vector<J>{};
            batch.reserve(chunk.size());
            for (auto index : chunk) {
                batch.push_back(std::move(jobs[index]));
            }
            if (auto fault = run_joined(batch, [](auto& handle) { handle.get(); })) {
                std::rethrow_exception(fault);
            }
        }
    }

private:
    std::size_t _lane_count;
    std::size_t _pushed = 0;
    bool _consumed = false;
    lanes_type _lanes;

    static auto checked_lane_count(std::size_t lane_count) -> std::size_t {
        if (lane_count < 1) {
            throw config_error("lane count must be at least 1");
        }
        return lane_count;
    }

    void require_live(const char* operation) const {
        if (_consumed) {
            throw std::logic_error(std::string(operation) + ": worker was already consumed by a run");
        }
    }

    auto take(const char* operation) -> lanes_type {
        require_live(operation);
        _consumed = true;
        return std::exchange(_lanes, lanes_type{});
    }

    // Back to global push order: push index p * L + l sits at lanes[l][p]
    auto flatten(lanes_type lanes) const -> std::vector<J> {
        auto flat = std::vector<J>{};
        flat.reserve(_pushed);
        for (std::size_t p = 0; flat.size() < _pushed; ++p) {
            for (auto& lane : lanes) {
                if (p < lane.size()) {
                    flat.push_back(std::move(lane[p]));
                }
            }
        }
        return flat;
    }

    // --- Lane bodies: return the first failure, if any ---

    template<typename Sink>
    static auto run_in_order(std::vector<J>& jobs, Sink&& sink) -> std::exception_ptr {
        try {
            for (auto& job : jobs) {
                auto handle = job();
                sink(handle);
            }
        } catch (...) {
            return std::current_exception();
        }
        return nullptr;
    }

    // Results are taken in launch order, regardless of completion order
    template<typename Sink>
    static auto run_joined(std::vector<J>& jobs, Sink&& sink) -> std::exception_ptr {
        auto handles = std::vector<job_handle_t<J>>{};
        auto fault = std::exception_ptr{};
        handles.reserve(jobs.size());

        for (auto& job : jobs) {
            try {
                handles.push_back(job());
            } catch (...) {
                fault = std::current_exception();
                break;
            }
        }
        for (auto& handle : handles) {
            if (fault) {
                handle.wait();
                continue;
            }
            try {
                sink(handle);
            } catch (...) {
                fault = std::current_exception();
            }
        }
        return fault;
    }

    // --- Lane driver ---

    // Each lane runs on its own pool thread and reports back through a queue.
    // Reports are put back in lane order; the lowest faulted lane is thrown.
    template<typename R, typename LaneBody>
    static auto drive_lanes(lanes_type lanes, LaneBody body) -> std::vector<R> {
        auto nonempty = std::any_of(lanes.begin(), lanes.end(), [](const auto& lane) { return !lane.empty(); });
        if (!nonempty) {
            return std::vector<R>(lanes.size());
        }
        auto num_lanes = lanes.size();
        auto reports = blocking_queue<detail::lane_report_t<R>>{};
        auto received = std::vector<detail::lane_report_t<R>>{};
        {
            auto pool = thread_pool_t(num_lanes);

            for (std::size_t i = 0; i < num_lanes; ++i) {
                pool.spawn([&reports, &body, i, jobs = std::move(lanes[i])]() mutable {
                    auto report = detail::lane_report_t<R>{i, R{}, nullptr};
                    report.fault = body(jobs, report.results);
                    reports.send(std::move(report));
                });
            }
            received = reports.recv_n(num_lanes);
        }
        std::sort(received.begin(), received.end(), [](const auto& a, const auto& b) {
            return a.lane < b.lane;
        });

        auto results = std::vector<R>{};
        results.reserve(num_lanes);
        for (auto& report : received) {
            if (report.fault) {
                throw lane_fault(report.lane, report.fault);
            }
            results.push_back(std::move(report.results));
        }
        return results;
    }
};

} // namespace parallel
} // namespace fanout
