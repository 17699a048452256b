#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <latch>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "fanout/parallel.hpp"

using namespace fanout::parallel;

// =============================================================================
// Helpers
// =============================================================================

// A latch whose wait gives up after a timeout. A false return means the
// callers were not running at the same time. std::latch has no timed wait,
// so the caller re-checks try_wait() until the deadline.
struct rendezvous_t {
    std::latch latch;

    explicit rendezvous_t(std::ptrdiff_t n) : latch(n) {}

    auto arrive_and_wait(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) -> bool {
        latch.count_down();
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!latch.try_wait()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::yield();
        }
        return true;
    }
};

// Thread-safe record of job indices in the order they ran
struct run_log_t {
    std::mutex mutex;
    std::vector<std::size_t> entries;

    void add(std::size_t i) {
        auto lock = std::lock_guard<std::mutex>(mutex);
        entries.push_back(i);
    }
};

auto indexed_job(std::size_t i) -> job_t<std::size_t> {
    return async_job([i] { return i; });
}

// =============================================================================
// Construction and lane assignment
// =============================================================================

void test_lane_count_zero_is_config_error() {
    auto threw = false;
    try {
        auto w = worker_t<job_t<int>>(0);
        (void)w;
    } catch (const config_error&) {
        threw = true;
    }
    assert(threw);

    // config_error is an invalid_argument
    threw = false;
    try {
        (void)worker_t<job_t<int>>::with_lanes(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "test_lane_count_zero_is_config_error: PASSED\n";
}

void test_default_lane_count() {
    auto w = worker_t<job_t<int>>{};
    assert(w.lane_count() == hardware_threads());
    assert(w.lane_count() >= 1);
    assert(w.lanes().size() == w.lane_count());
    assert(w.size() == 0);

    std::cout << "test_default_lane_count: PASSED\n";
}

void test_round_robin_assignment() {
    auto w = worker_t<job_t<std::size_t>>(3);
    for (std::size_t i = 0; i < 7; ++i) {
        w.push(indexed_job(i));
    }
    assert(w.size() == 7);
    assert(w.lanes()[0].size() == 3);
    assert(w.lanes()[1].size() == 2);
    assert(w.lanes()[2].size() == 2);

    // Lane sizes never differ by more than one
    auto w2 = worker_t<job_t<std::size_t>>(4);
    for (std::size_t i = 0; i < 10; ++i) {
        w2.push(indexed_job(i));
        auto [lo, hi] = std::minmax_element(w2.lanes().begin(), w2.lanes().end(),
            [](const auto& a, const auto& b) { return a.size() < b.size(); });
        assert(hi->size() - lo->size() <= 1);
    }

    std::cout << "test_round_robin_assignment: PASSED\n";
}

// =============================================================================
// Strategies
// =============================================================================

void test_run_completes_every_job() {
    auto counter = std::atomic<int>{0};
    auto w = worker_t<job_t<void>>(3);

    for (int i = 0; i < 20; ++i) {
        w.push(async_job([&counter] { ++counter; }));
    }
    std::move(w).run();
    assert(counter == 20);

    std::cout << "test_run_completes_every_job: PASSED\n";
}

void test_run_all_joined_completes_every_job() {
    auto counter = std::atomic<int>{0};
    auto w = worker_t<job_t<void>>(4);

    for (int i = 0; i < 21; ++i) {
        w.push(async_job([&counter] { ++counter; }));
    }
    std::move(w).run_all_joined();
    assert(counter == 21);

    std::cout << "test_run_all_joined_completes_every_job: PASSED\n";
}

void test_collect_results_lane_major_order() {
    auto expected = std::vector<std::size_t>{0, 3, 6, 1, 4, 2, 5};

    auto w = worker_t<job_t<std::size_t>>(3);
    for (std::size_t i = 0; i < 7; ++i) {
        w.push(indexed_job(i));
    }
    assert(std::move(w).run_and_collect_results() == expected);

    auto joined = worker_t<job_t<std::size_t>>(3);
    for (std::size_t i = 0; i < 7; ++i) {
        joined.push(indexed_job(i));
    }
    assert(std::move(joined).run_all_joined_and_collect_results() == expected);

    std::cout << "test_collect_results_lane_major_order: PASSED\n";
}

void test_single_lane_preserves_push_order() {
    auto w = worker_t<job_t<std::size_t>>(1);
    for (std::size_t i = 0; i < 6; ++i) {
        w.push(indexed_job(i));
    }
    auto results = std::move(w).run_and_collect_results();
    assert((results == std::vector<std::size_t>{0, 1, 2, 3, 4, 5}));

    std::cout << "test_single_lane_preserves_push_order: PASSED\n";
}

void test_joined_results_in_launch_order() {
    // Earlier jobs finish last; results still follow launch order
    auto w = worker_t<job_t<int>>(1);
    for (int i = 0; i < 4; ++i) {
        w.push(async_job([i] {
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (4 - i)));
            return i;
        }));
    }
    auto results = std::move(w).run_all_joined_and_collect_results();
    assert((results == std::vector<int>{0, 1, 2, 3}));

    std::cout << "test_joined_results_in_launch_order: PASSED\n";
}

void test_run_all_joined_runs_lane_concurrently() {
    auto meet = rendezvous_t(3);
    auto all_met = std::atomic<bool>{true};
    auto w = worker_t<job_t<void>>(1);

    for (int i = 0; i < 3; ++i) {
        w.push(async_job([&meet, &all_met] {
            if (!meet.arrive_and_wait()) all_met = false;
        }));
    }
    std::move(w).run_all_joined();
    assert(all_met);

    std::cout << "test_run_all_joined_runs_lane_concurrently: PASSED\n";
}

void test_lanes_run_concurrently() {
    // One job per lane; run() awaits in order within a lane, so the meeting
    // can only happen if the lanes are on different threads
    auto meet = rendezvous_t(4);
    auto all_met = std::atomic<bool>{true};
    auto w = worker_t<job_t<void>>(4);

    for (int i = 0; i < 4; ++i) {
        w.push(async_job([&meet, &all_met] {
            if (!meet.arrive_and_wait()) all_met = false;
        }));
    }
    std::move(w).run();
    assert(all_met);

    std::cout << "test_lanes_run_concurrently: PASSED\n";
}

void test_empty_worker() {
    auto a = worker_t<job_t<int>>(3);
    std::move(a).run();

    auto b = worker_t<job_t<int>>(3);
    std::move(b).run_all_joined();

    auto c = worker_t<job_t<int>>(3);
    assert(std::move(c).run_and_collect_results().empty());

    auto d = worker_t<job_t<int>>(3);
    assert(std::move(d).run_all_joined_and_collect_results().empty());

    auto e = worker_t<job_t<int>>(3);
    std::move(e).run_single_threaded(2);

    std::cout << "test_empty_worker: PASSED\n";
}

void test_ready_jobs() {
    auto w = worker_t<job_t<std::string>>(2);
    w.push(ready_job(std::string("a")));
    w.push(ready_job(std::string("b")));
    w.push(ready_job(std::string("c")));
    auto results = std::move(w).run_and_collect_results();
    assert((results == std::vector<std::string>{"a", "c", "b"}));

    std::cout << "test_ready_jobs: PASSED\n";
}

// =============================================================================
// Single-threaded strategy
// =============================================================================

void test_chunk_plan() {
    auto plan = chunk_plan(5, 2);
    assert(plan.size() == 3);
    assert((plan[0] == std::vector<std::size_t>{0, 3}));
    assert((plan[1] == std::vector<std::size_t>{1, 4}));
    assert((plan[2] == std::vector<std::size_t>{2}));

    // Everything fits in one chunk
    auto single = chunk_plan(3, 8);
    assert(single.size() == 1);
    assert((single[0] == std::vector<std::size_t>{0, 1, 2}));

    assert(chunk_plan(0, 4).empty());

    auto threw = false;
    try {
        (void)chunk_plan(5, 0);
    } catch (const config_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "test_chunk_plan: PASSED\n";
}

void test_single_threaded_chunk_order() {
    auto log = run_log_t{};
    auto w = worker_t<job_t<void>>(3);

    for (std::size_t i = 0; i < 5; ++i) {
        w.push(async_job([&log, i] { log.add(i); }));
    }
    std::move(w).run_single_threaded(2);

    // Chunks run one after another; order within a chunk is unspecified
    assert(log.entries.size() == 5);
    auto first = std::set<std::size_t>(log.entries.begin(), log.entries.begin() + 2);
    auto second = std::set<std::size_t>(log.entries.begin() + 2, log.entries.begin() + 4);
    assert((first == std::set<std::size_t>{0, 3}));
    assert((second == std::set<std::size_t>{1, 4}));
    assert(log.entries[4] == 2);

    std::cout << "test_single_threaded_chunk_order: PASSED\n";
}

void test_single_threaded_chunk_runs_concurrently() {
    auto meet = rendezvous_t(3);
    auto all_met = std::atomic<bool>{true};
    auto w = worker_t<job_t<void>>(1);

    for (int i = 0; i < 3; ++i) {
        w.push(async_job([&meet, &all_met] {
            if (!meet.arrive_and_wait()) all_met = false;
        }));
    }
    std::move(w).run_single_threaded(3);
    assert(all_met);

    std::cout << "test_single_threaded_chunk_runs_concurrently: PASSED\n";
}

void test_single_threaded_default_batch_is_lane_count() {
    auto log = run_log_t{};
    auto w = worker_t<job_t<void>>(2);

    for (std::size_t i = 0; i < 4; ++i) {
        w.push(async_job([&log, i] { log.add(i); }));
    }
    std::move(w).run_single_threaded();

    // ceil(4 / 2) = 2 chunks: {0, 2} then {1, 3}
    assert(log.entries.size() == 4);
    auto first = std::set<std::size_t>(log.entries.begin(), log.entries.begin() + 2);
    assert((first == std::set<std::size_t>{0, 2}));

    std::cout << "test_single_threaded_default_batch_is_lane_count: PASSED\n";
}

void test_single_threaded_default_fits_one_batch() {
    // Three jobs with four lanes: a single concurrent batch
    auto meet = rendezvous_t(3);
    auto all_met = std::atomic<bool>{true};
    auto w = worker_t<job_t<void>>(4);

    for (int i = 0; i < 3; ++i) {
        w.push(async_job([&meet, &all_met] {
            if (!meet.arrive_and_wait()) all_met = false;
        }));
    }
    std::move(w).run_single_threaded();
    assert(all_met);

    std::cout << "test_single_threaded_default_fits_one_batch: PASSED\n";
}

void test_single_threaded_batch_zero() {
    auto w = worker_t<job_t<void>>(2);
    w.push(async_job([] {}));

    auto threw = false;
    try {
        std::move(w).run_single_threaded(0);
    } catch (const config_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "test_single_threaded_batch_zero: PASSED\n";
}

void test_single_threaded_stops_after_failing_chunk() {
    auto log = run_log_t{};
    auto w = worker_t<job_t<void>>(1);

    // Chunks of {0, 2} and {1, 3}; job 0 fails
    for (std::size_t i = 0; i < 4; ++i) {
        w.push(async_job([&log, i] {
            log.add(i);
            if (i == 0) throw std::runtime_error("job 0 failed");
        }));
    }

    auto message = std::string{};
    try {
        std::move(w).run_single_threaded(2);
    } catch (const std::runtime_error& e) {
        message = e.what();
    }
    assert(message == "job 0 failed");

    // The failing chunk settled, the next one never started
    auto ran = std::set<std::size_t>(log.entries.begin(), log.entries.end());
    assert((ran == std::set<std::size_t>{0, 2}));

    std::cout << "test_single_threaded_stops_after_failing_chunk: PASSED\n";
}

// =============================================================================
// Failures and consumption
// =============================================================================

void test_lane_fault_after_all_lanes_finish() {
    auto counter = std::atomic<int>{0};
    auto w = worker_t<job_t<void>>(3);

    for (int i = 0; i < 9; ++i) {
        w.push(async_job([&counter, i] {
            if (i == 4) throw std::runtime_error("boom");
            ++counter;
        }));
    }

    auto caught = false;
    try {
        std::move(w).run_all_joined();
    } catch (const lane_fault& f) {
        caught = true;
        assert(f.lane() == 1);
        assert(f.cause() != nullptr);
        assert(std::string(f.what()).find("boom") != std::string::npos);
    }
    assert(caught);

    // Other lanes finished, and the joined lane awaited all its jobs
    assert(counter == 8);

    std::cout << "test_lane_fault_after_all_lanes_finish: PASSED\n";
}

void test_lane_fault_lowest_lane_wins() {
    auto w = worker_t<job_t<int>>(3);
    for (int i = 0; i < 3; ++i) {
        w.push(async_job([i]() -> int {
            if (i > 0) throw std::runtime_error("lane " + std::to_string(i));
            return i;
        }));
    }

    auto caught = false;
    try {
        (void)std::move(w).run_and_collect_results();
    } catch (const lane_fault& f) {
        caught = true;
        assert(f.lane() == 1);
        try {
            f.rethrow_cause();
        } catch (const std::runtime_error& e) {
            assert(std::string(e.what()) == "lane 1");
        }
    }
    assert(caught);

    std::cout << "test_lane_fault_lowest_lane_wins: PASSED\n";
}

void test_run_stops_lane_at_first_failure() {
    auto log = run_log_t{};
    auto w = worker_t<job_t<void>>(1);

    for (std::size_t i = 0; i < 4; ++i) {
        w.push(async_job([&log, i] {
            log.add(i);
            if (i == 1) throw std::runtime_error("stop");
        }));
    }

    auto caught = false;
    try {
        std::move(w).run();
    } catch (const lane_fault& f) {
        caught = true;
        assert(f.lane() == 0);
    }
    assert(caught);
    assert((log.entries == std::vector<std::size_t>{0, 1}));

    std::cout << "test_run_stops_lane_at_first_failure: PASSED\n";
}

void test_consumed_worker() {
    auto w = worker_t<job_t<int>>(2);
    w.push(ready_job(1));
    std::move(w).run();
    assert(w.consumed());

    auto threw_push = false;
    try {
        w.push(ready_job(2));
    } catch (const std::logic_error&) {
        threw_push = true;
    }
    assert(threw_push);

    auto threw_run = false;
    try {
        std::move(w).run_all_joined();
    } catch (const std::logic_error&) {
        threw_run = true;
    }
    assert(threw_run);

    // Moving out of a worker consumes the source
    auto a = worker_t<job_t<int>>(2);
    a.push(ready_job(7));
    auto b = std::move(a);
    assert(a.consumed());
    assert(!b.consumed());
    assert(b.size() == 1);
    assert((std::move(b).run_and_collect_results() == std::vector<int>{7}));

    std::cout << "test_consumed_worker: PASSED\n";
}

// =============================================================================
// Queue and pool
// =============================================================================

void test_blocking_queue() {
    auto q = blocking_queue<int>{};
    assert(!q.try_recv());

    auto producer = std::thread([&q] {
        for (int i = 0; i < 5; ++i) q.send(i);
    });
    auto items = q.recv_n(5);
    producer.join();

    assert((items == std::vector<int>{0, 1, 2, 3, 4}));
    assert(!q.try_recv());

    std::cout << "test_blocking_queue: PASSED\n";
}

void test_thread_pool_drains_on_destruction() {
    auto counter = std::atomic<int>{0};
    {
        auto pool = thread_pool_t(2);
        assert(pool.num_threads() == 2);
        for (int i = 0; i < 10; ++i) {
            pool.spawn([&counter] { ++counter; });
        }
    }
    assert(counter == 10);

    std::cout << "test_thread_pool_drains_on_destruction: PASSED\n";
}

int main() {
    std::cout << "=== Construction ===\n\n";

    test_lane_count_zero_is_config_error();
    test_default_lane_count();
    test_round_robin_assignment();

    std::cout << "\n=== Strategies ===\n\n";

    test_run_completes_every_job();
    test_run_all_joined_completes_every_job();
    test_collect_results_lane_major_order();
    test_single_lane_preserves_push_order();
    test_joined_results_in_launch_order();
    test_run_all_joined_runs_lane_concurrently();
    test_lanes_run_concurrently();
    test_empty_worker();
    test_ready_jobs();

    std::cout << "\n=== Single-threaded ===\n\n";

    test_chunk_plan();
    test_single_threaded_chunk_order();
    test_single_threaded_chunk_runs_concurrently();
    test_single_threaded_default_batch_is_lane_count();
    test_single_threaded_default_fits_one_batch();
    test_single_threaded_batch_zero();
    test_single_threaded_stops_after_failing_chunk();

    std::cout << "\n=== Failures ===\n\n";

    test_lane_fault_after_all_lanes_finish();
    test_lane_fault_lowest_lane_wins();
    test_run_stops_lane_at_first_failure();
    test_consumed_worker();

    std::cout << "\n=== Queue and pool ===\n\n";

    test_blocking_queue();
    test_thread_pool_drains_on_destruction();

    std::cout << "\nAll worker tests passed.\n";
    return 0;
}
