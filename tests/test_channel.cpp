#include <catch2/catch.hpp>
#include "Channel.hpp"
#include "ThreadPool.hpp"
#include "test_support.hpp"
#include <chrono>
#include <future>
#include <thread>

using namespace codesync;
using codesync::testing::PeakCounter;

TEST_CASE("Channel delivers in order and drains after close", "[channel]") {
    Channel<int> ch(4);
    REQUIRE(ch.push(1));
    REQUIRE(ch.push(2));
    ch.close();
    REQUIRE_FALSE(ch.push(3));

    REQUIRE(ch.pop() == std::optional<int>(1));
    REQUIRE(ch.pop() == std::optional<int>(2));
    REQUIRE_FALSE(ch.pop().has_value());
    REQUIRE(ch.closed());
}

TEST_CASE("A full channel blocks the producer until the consumer catches up", "[channel]") {
    Channel<int> ch(2);
    std::thread producer([&ch] {
        for (int i = 0; i < 100; ++i) ch.push(i);
        ch.close();
    });

    int expected = 0;
    while (auto v = ch.pop()) {
        REQUIRE(*v == expected);
        ++expected;
    }
    producer.join();
    REQUIRE(expected == 100);
}

TEST_CASE("Closing wakes a blocked consumer", "[channel]") {
    Channel<std::string> ch(1);
    auto consumer = std::async(std::launch::async, [&ch] { return ch.pop(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ch.close();
    REQUIRE_FALSE(consumer.get().has_value());
}

TEST_CASE("In-flight limiter bounds concurrent work", "[channel][limiter]") {
    ThreadPool pool(8);
    InFlightLimiter limiter(3);
    PeakCounter peak;
    std::vector<std::future<void>> pending;

    for (int i = 0; i < 24; ++i) {
        limiter.acquire();
        pending.push_back(pool.enqueue([&limiter, &peak] {
            InFlightReleaser release(limiter);
            peak.enter();
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            peak.leave();
        }));
    }
    for (auto& f : pending) f.get();

    REQUIRE(peak.peak() <= 3);
    REQUIRE(peak.peak() >= 1);
}

TEST_CASE("Thread pool returns task results through futures", "[threadpool]") {
    ThreadPool pool(2);
    auto sum = pool.enqueue([](int a, int b) { return a + b; }, 2, 3);
    REQUIRE(sum.get() == 5);

    auto boom = pool.enqueue([]() -> int { throw std::runtime_error("boom"); });
    REQUIRE_THROWS_AS(boom.get(), std::runtime_error);
}
