#include <catch2/catch.hpp>

#include "core/ThreadPool.hpp"

#include <atomic>
#include <stdexcept>
#include <vector>

using fastget::core::ThreadPool;

TEST_CASE("thread pool returns task results through futures") {
    ThreadPool pool(4);
    REQUIRE(pool.size() == 4);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 16; ++i) {
        results.push_back(pool.submit([](int x) { return x * x; }, i));
    }
    for (int i = 0; i < 16; ++i) {
        REQUIRE(results[i].get() == i * i);
    }
}

TEST_CASE("a throwing task delivers its exception to the future") {
    ThreadPool pool(2);
    auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    auto fine = pool.submit([] { return 7; });

    REQUIRE_THROWS_WITH(failing.get(), "boom");
    REQUIRE(fine.get() == 7);
}

TEST_CASE("queued tasks still run when the pool is destroyed") {
    std::atomic<int> done{0};
    {
        ThreadPool pool(1);
        for (int i = 0; i < 10; ++i) {
            pool.submit([&done] { ++done; });
        }
    }
    REQUIRE(done == 10);
}
