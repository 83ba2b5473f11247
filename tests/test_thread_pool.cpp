#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <ifreader/common/thread_pool.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace ifreader;

static std::uint64_t parallel_sum(ThreadPool &pool, std::uint64_t from,
                                  std::uint64_t to) {
    if (to - from <= 4) {
        std::uint64_t sum = 0;
        for (std::uint64_t i = from; i < to; ++i) sum += i;
        return sum;
    }
    std::uint64_t mid = from + (to - from) / 2;
    auto left = pool.fork([&pool, from, mid]() {
        return parallel_sum(pool, from, mid);
    });
    std::uint64_t right = parallel_sum(pool, mid, to);
    return left->join() + right;
}

TEST_CASE("ThreadPool - Construction") {
    ThreadPool pool(3);
    CHECK(pool.size() == 3);

    ThreadPool automatic;
    CHECK(automatic.size() >= 1);

    CHECK(&ThreadPool::shared() == &ThreadPool::shared());
    CHECK(ThreadPool::shared().size() >= 1);
}

TEST_CASE("ThreadPool - Submitted jobs all run") {
    std::atomic<int> counter{0};
    {
        ThreadPool pool(4);
        for (int i = 0; i < 100; ++i) {
            pool.submit([&counter]() { counter++; });
        }
    }
    // Destruction drains the queue
    CHECK(counter.load() == 100);
}

TEST_CASE("ThreadPool - Fork and join") {
    ThreadPool pool(2);

    auto task = pool.fork([]() { return 21 * 2; });
    CHECK(task->join() == 42);
    CHECK(task->is_claimed());

    auto text = pool.fork([]() { return std::string("forked"); });
    CHECK(text->join() == "forked");
}

TEST_CASE("ThreadPool - Recursion deeper than the pool") {
    SUBCASE("One worker") {
        ThreadPool pool(1);
        CHECK(parallel_sum(pool, 0, 1000) == 499500);
    }
    SUBCASE("Several workers") {
        ThreadPool pool(4);
        CHECK(parallel_sum(pool, 0, 100000) == 4999950000ULL);
    }
}

TEST_CASE("ThreadPool - Join runs unclaimed tasks inline") {
    ThreadPool pool(1);

    // Occupy the only worker so the forked task stays queued
    std::atomic<bool> release{false};
    std::atomic<bool> started{false};
    pool.submit([&]() {
        started = true;
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    while (!started.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    std::thread::id runner;
    auto task = pool.fork([&runner]() {
        runner = std::this_thread::get_id();
        return 7;
    });
    CHECK(task->join() == 7);
    CHECK(runner == std::this_thread::get_id());

    release = true;
}

TEST_CASE("ThreadPool - Exceptions propagate through join") {
    ThreadPool pool(2);

    auto task = pool.fork([]() -> int {
        throw std::runtime_error("task failed");
    });
    CHECK_THROWS_WITH_AS(task->join(), "task failed", std::runtime_error);

    // Failing plain jobs do not take the worker down
    pool.submit([]() { throw std::runtime_error("job failed"); });
    auto after = pool.fork([]() { return 1; });
    CHECK(after->join() == 1);
}

TEST_CASE("ForkedTask - Runs exactly once") {
    std::atomic<int> runs{0};
    ForkedTask<int> task([&runs]() { return ++runs; });

    CHECK_FALSE(task.is_claimed());
    CHECK(task.run());
    CHECK_FALSE(task.run());
    CHECK(task.join() == 1);
    CHECK(runs.load() == 1);
}
