#include "engine/CompletionSignal.hpp"

#include <atomic>
#include <chrono>
#include <thread>

#include <doctest/doctest.h>

using namespace std::chrono_literals;

TEST_CASE("CompletionSignal closes once")
{
    tl::engine::CompletionSignal signal;
    CHECK_FALSE(signal.is_closed());
    CHECK(signal.close());
    CHECK(signal.is_closed());
    CHECK_FALSE(signal.close());
    CHECK(signal.wait_for(0ms));
}

TEST_CASE("CompletionSignal releases every waiter")
{
    tl::engine::CompletionSignal signal;
    std::atomic<int> released{0};
    std::thread first([&] { signal.wait(); ++released; });
    std::thread second([&] { signal.wait(); ++released; });
    CHECK_FALSE(signal.wait_for(20ms));
    signal.close();
    first.join();
    second.join();
    CHECK(released.load() == 2);
}

TEST_CASE("CompletionSignal observers")
{
    tl::engine::CompletionSignal signal;
    int fired = 0;
    auto kept = signal.on_close([&] { ++fired; });
    auto removed = signal.on_close([&] { fired += 10; });
    CHECK(kept != 0);
    signal.remove_observer(removed);
    signal.close();
    signal.close();
    CHECK(fired == 1);

    SUBCASE("late observers run immediately")
    {
        auto id = signal.on_close([&] { fired += 100; });
        CHECK(id == 0);
        CHECK(fired == 101);
    }
}

TEST_CASE("wait_any prefers the earliest closed signal")
{
    tl::engine::CompletionSignal a;
    tl::engine::CompletionSignal b;
    tl::engine::CompletionSignal c;
    b.close();
    c.close();
    CHECK(tl::engine::wait_any({&a, &b, &c}) == 1);
    a.close();
    CHECK(tl::engine::wait_any({&a, &b, &c}) == 0);
}

TEST_CASE("wait_any wakes on a later close")
{
    tl::engine::CompletionSignal a;
    tl::engine::CompletionSignal b;
    std::thread closer(
        [&]
        {
            std::this_thread::sleep_for(20ms);
            b.close();
        });
    CHECK(tl::engine::wait_any({&a, &b}) == 1);
    closer.join();
}

TEST_CASE("wait_any_for times out")
{
    tl::engine::CompletionSignal a;
    tl::engine::CompletionSignal b;
    CHECK_FALSE(tl::engine::wait_any_for({&a, &b}, 20ms).has_value());
    b.close();
    auto picked = tl::engine::wait_any_for({&a, &b}, 20ms);
    REQUIRE(picked.has_value());
    CHECK(*picked == 1);
}
