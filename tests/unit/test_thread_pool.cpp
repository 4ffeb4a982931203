#include <catch2/catch_test_macros.hpp>
#include "goapagent/platform/thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>

using namespace goapagent::platform;
using namespace std::chrono_literals;

TEST_CASE("Thread pool runs tasks", "[thread_pool]") {
    ThreadPool pool(2);
    std::atomic<int> sum{0};

    auto first = pool.run([&sum] { sum += 40; });
    auto second = pool.run([&sum] { sum += 2; });
    first.get();
    second.get();

    REQUIRE(sum == 42);
    REQUIRE(pool.size() == 2);
}

TEST_CASE("Shutdown drains the queue", "[thread_pool]") {
    std::atomic<int> done{0};
    ThreadPool pool(2);
    for (int i = 0; i < 20; ++i) {
        pool.run([&done] { ++done; });
    }

    pool.shutdown();
    pool.shutdown();

    REQUIRE(done == 20);
    REQUIRE(pool.pending() == 0);
    REQUIRE_THROWS_AS(pool.run([] {}), std::runtime_error);
}

TEST_CASE("A task may destroy the pool running it", "[thread_pool]") {
    auto* pool = new ThreadPool(2);
    std::promise<void> destroyed;
    auto signal = destroyed.get_future();

    pool->run([pool, &destroyed] {
        delete pool;
        destroyed.set_value();
    });

    REQUIRE(signal.wait_for(5s) == std::future_status::ready);
}

TEST_CASE("Asyncer propagates exceptions", "[thread_pool]") {
    ThreadPoolAsyncer asyncer(1);

    auto ok = asyncer.async([] {});
    auto failing = asyncer.async([] { throw std::runtime_error("boom"); });

    REQUIRE_NOTHROW(ok.get());
    REQUIRE_THROWS_AS(failing.get(), std::runtime_error);
}
