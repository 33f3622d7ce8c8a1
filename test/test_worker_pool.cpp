#include <catch2/catch_all.hpp>
#include <catch2/catch_test_macros.hpp>
#include "WorkerPool.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

TEST_CASE("Submitted jobs complete through their futures", "[pool]") {
    WorkerPool pool(3);
    REQUIRE(pool.size() == 3);

    std::atomic<int> sum{0};
    std::vector<std::future<void>> futures;
    for (int i = 1; i <= 100; ++i) {
        futures.push_back(pool.submit([&sum, i]() { sum += i; }));
    }
    for (auto& f : futures) f.get();

    REQUIRE(sum.load() == 5050);
    REQUIRE(pool.get_stats().completed_tasks == 100);
    REQUIRE(pool.get_stats().failed_tasks == 0);
}

TEST_CASE("A failing job reports through its future", "[pool]") {
    WorkerPool pool(2);
    auto ok = pool.submit([]() {});
    auto bad = pool.submit([]() { throw std::runtime_error("boom"); });

    REQUIRE_NOTHROW(ok.get());
    REQUIRE_THROWS_AS(bad.get(), std::runtime_error);
    REQUIRE(pool.get_stats().failed_tasks == 1);
}

TEST_CASE("Chunked runs cover every index exactly once", "[pool]") {
    WorkerPool pool(4);
    size_t count = GENERATE(1, 3, 4, 10, 1001);
    CAPTURE(count);

    std::vector<int> hits(count, 0);
    pool.run_chunked(count, [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) hits[i]++;
    });

    for (size_t i = 0; i < count; ++i) REQUIRE(hits[i] == 1);
}

TEST_CASE("Chunked runs rethrow after every chunk finishes", "[pool]") {
    WorkerPool pool(4);
    std::atomic<int> finished{0};

    REQUIRE_THROWS_WITH(
        pool.run_chunked(8, [&](size_t begin, size_t) {
            if (begin == 0) throw std::runtime_error("first chunk failed");
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            finished++;
        }),
        "first chunk failed");

    REQUIRE(finished.load() == 3);
}

TEST_CASE("for_each_chunk runs inline without a pool", "[pool]") {
    std::vector<std::pair<size_t, size_t>> calls;
    const auto caller = std::this_thread::get_id();
    bool same_thread = true;

    for_each_chunk(nullptr, 5, [&](size_t begin, size_t end) {
        calls.emplace_back(begin, end);
        same_thread = same_thread && std::this_thread::get_id() == caller;
    });

    REQUIRE(calls.size() == 1);
    REQUIRE(calls[0] == std::pair<size_t, size_t>(0, 5));
    REQUIRE(same_thread);

    WorkerPool single(1);
    calls.clear();
    for_each_chunk(&single, 5, [&](size_t begin, size_t end) { calls.emplace_back(begin, end); });
    REQUIRE(calls.size() == 1);
}

TEST_CASE("Destroying the pool drains queued jobs", "[pool]") {
    std::atomic<int> done{0};
    {
        WorkerPool pool(1);
        for (int i = 0; i < 20; ++i) {
            // Futures are dropped on purpose; the destructor still runs every job
            pool.submit([&done]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                done++;
            });
        }
    }
    REQUIRE(done.load() == 20);
}

TEST_CASE("Stats count workers that are running a job", "[pool]") {
    WorkerPool pool(2);
    REQUIRE(pool.get_stats().active_workers == 0);

    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();

    auto job = pool.submit([&started, released]() {
        started.set_value();
        released.wait();
    });
    started.get_future().wait();
    REQUIRE(pool.get_stats().active_workers == 1);

    release.set_value();
    job.get();
    REQUIRE(pool.get_stats().active_workers == 0);
}
