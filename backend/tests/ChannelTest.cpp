#include "engine/Channel.hpp"
#include "engine/CompletionSignal.hpp"

#include <atomic>
#include <chrono>
#include <thread>

#include <doctest/doctest.h>

using namespace std::chrono_literals;

TEST_CASE("Channel delivers in order and drains after close")
{
    tl::engine::Channel<int> channel;
    CHECK(channel.send(1));
    CHECK(channel.send(2));
    channel.close();
    CHECK_FALSE(channel.send(3));
    CHECK(channel.receive() == 1);
    CHECK(channel.receive() == 2);
    CHECK_FALSE(channel.receive().has_value());
}

TEST_CASE("bounded Channel blocks senders until space frees up")
{
    tl::engine::Channel<int> channel(1);
    REQUIRE(channel.send(1));
    std::atomic_bool sent{false};
    std::thread sender(
        [&]
        {
            channel.send(2);
            sent = true;
        });
    std::this_thread::sleep_for(30ms);
    CHECK_FALSE(sent.load());
    CHECK(channel.receive() == 1);
    sender.join();
    CHECK(sent.load());
    CHECK(channel.receive() == 2);
}

TEST_CASE("cancellation unblocks a full Channel")
{
    tl::engine::Channel<int> channel(1);
    auto cancel = tl::engine::make_cancel_token();
    REQUIRE(channel.send(1, *cancel));
    std::atomic_bool result{true};
    std::thread sender([&] { result = channel.send(2, *cancel); });
    std::this_thread::sleep_for(20ms);
    cancel->close();
    sender.join();
    CHECK_FALSE(result.load());
    CHECK(channel.size() == 1);
}

TEST_CASE("receive with cancellation")
{
    tl::engine::Channel<int> channel;
    auto cancel = tl::engine::make_cancel_token();
    std::thread canceller(
        [&]
        {
            std::this_thread::sleep_for(20ms);
            cancel->close();
        });
    CHECK_FALSE(channel.receive(*cancel).has_value());
    canceller.join();

    SUBCASE("a cancelled receive ignores queued values")
    {
        channel.send(7);
        CHECK_FALSE(channel.receive(*cancel).has_value());
        CHECK(channel.try_receive() == 7);
    }
}

TEST_CASE("receive_for times out on an empty Channel")
{
    tl::engine::Channel<int> channel;
    CHECK_FALSE(channel.receive_for(10ms).has_value());
    CHECK_FALSE(channel.is_closed());
}
