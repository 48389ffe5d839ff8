#include "engine/EventStream.hpp"
#include "engine/TransferTracker.hpp"

#include "FakeTransfer.hpp"

#include <memory>
#include <vector>

#include <doctest/doctest.h>

using tl::engine::EventStream;
using tl::engine::EventType;
using tl::engine::make_cancel_token;
using tl::engine::TransferTracker;
using tl::test::closes_soon;
using tl::test::drain;
using tl::test::FakeTransfer;
using tl::test::take;
using tl::test::types_of;

TEST_CASE("stream follows a transfer from added to closed")
{
    auto transfer = FakeTransfer::with_layout("c0", {10, 10}, 10);
    auto tracker = TransferTracker::create(transfer);
    auto cancel = make_cancel_token();
    auto events = EventStream::open(tracker, cancel, 4);

    auto first = take(*events, 1);
    REQUIRE(first.size() == 1);
    CHECK(first[0].type == EventType::Added);
    CHECK(first[0].transfer == transfer);

    transfer->publish_info();
    REQUIRE(take(*events, 1).at(0).type == EventType::GotInfo);

    transfer->complete_piece(0);
    REQUIRE(closes_soon(*tracker->file_done("fake/file0")));
    transfer->complete_piece(1);
    REQUIRE(closes_soon(tracker->seeding_done()));

    auto middle = take(*events, 6);
    CHECK(types_of(middle) ==
          std::vector<EventType>{EventType::PieceDone, EventType::FileDone,
                                 EventType::PieceDone, EventType::FileDone,
                                 EventType::DownloadDone,
                                 EventType::SeedingDone});
    REQUIRE(middle.size() == 6);
    CHECK(middle[0].piece == 0);
    CHECK(middle[1].file->path == "fake/file0");
    CHECK(middle[2].piece == 1);
    CHECK(middle[3].file->path == "fake/file1");
    CHECK_FALSE(middle[4].piece.has_value());
    CHECK_FALSE(middle[4].file.has_value());

    // Nothing more until the transfer goes away.
    CHECK_FALSE(events->receive_for(tl::test::kQuietPeriod).has_value());
    transfer->close();
    auto rest = drain(*events);
    CHECK(types_of(rest) == std::vector<EventType>{EventType::Closed});
    CHECK(events->is_closed());
}

TEST_CASE("a file spanning several pieces is done after its last piece")
{
    auto transfer = FakeTransfer::with_layout("c1", {4, 12}, 4);
    auto tracker = TransferTracker::create(transfer);
    transfer->publish_info();
    auto cancel = make_cancel_token();
    auto events = EventStream::open(tracker, cancel, 0);

    for (int piece : {3, 1, 0, 2})
    {
        transfer->complete_piece(piece);
    }
    REQUIRE(closes_soon(tracker->seeding_done()));
    transfer->close();
    auto received = drain(*events);

    std::vector<int> pieces;
    int file1_position = -1;
    int last_file1_piece = -1;
    for (int i = 0; i < static_cast<int>(received.size()); ++i)
    {
        auto const &event = received[static_cast<std::size_t>(i)];
        if (event.type == EventType::PieceDone)
        {
            pieces.push_back(*event.piece);
            if (*event.piece != 0)
            {
                last_file1_piece = i;
            }
        }
        if (event.type == EventType::FileDone &&
            event.file->path == "fake/file1")
        {
            file1_position = i;
        }
    }
    CHECK(pieces.size() == 4);
    REQUIRE(file1_position >= 0);
    CHECK(file1_position > last_file1_piece);
    REQUIRE(received.size() == 11);
    CHECK(received[8].type == EventType::DownloadDone);
    CHECK(received[9].type == EventType::SeedingDone);
    CHECK(received[10].type == EventType::Closed);
}

TEST_CASE("late subscriber replays a finished transfer")
{
    auto transfer = FakeTransfer::with_layout("c2", {0, 6}, 6);
    auto tracker = TransferTracker::create(transfer);
    transfer->publish_info();
    transfer->complete_piece(0);
    REQUIRE(closes_soon(tracker->seeding_done()));

    auto cancel = make_cancel_token();
    auto events = EventStream::open(tracker, cancel, 16);
    auto replay = take(*events, 7);
    CHECK(types_of(replay) ==
          std::vector<EventType>{EventType::Added, EventType::GotInfo,
                                 EventType::PieceDone, EventType::FileDone,
                                 EventType::FileDone, EventType::DownloadDone,
                                 EventType::SeedingDone});
    REQUIRE(replay.size() == 7);
    CHECK(replay[3].file->path == "fake/file0");
    CHECK(replay[4].file->path == "fake/file1");

    // The stream stays open until the transfer goes away.
    CHECK_FALSE(events->receive_for(tl::test::kQuietPeriod).has_value());
    CHECK_FALSE(events->is_closed());

    transfer->close();
    auto rest = drain(*events);
    CHECK(types_of(rest) == std::vector<EventType>{EventType::Closed});
}

TEST_CASE("cancelling ends the stream without a closed event")
{
    auto transfer = FakeTransfer::with_layout("c3", {10}, 5);
    auto tracker = TransferTracker::create(transfer);
    auto cancel = make_cancel_token();
    auto events = EventStream::open(tracker, cancel, 1);
    REQUIRE(take(*events, 1).at(0).type == EventType::Added);

    cancel->close();
    transfer->close();
    auto rest = drain(*events);
    for (auto const &event : rest)
    {
        CHECK(event.type != EventType::Closed);
    }
    CHECK(events->is_closed());
}

TEST_CASE("cancelling unblocks a stream stuck on a full channel")
{
    auto transfer = FakeTransfer::with_layout("c4", {10}, 5);
    auto tracker = TransferTracker::create(transfer);
    transfer->publish_info();
    auto cancel = make_cancel_token();
    auto events = EventStream::open(tracker, cancel, 1);

    transfer->complete_piece(0);
    transfer->complete_piece(1);
    REQUIRE(closes_soon(tracker->download_done()));
    CHECK_FALSE(events->is_closed());
    cancel->close();

    // At most the single buffered event is left.
    auto rest = drain(*events);
    CHECK(rest.size() <= 1);
    CHECK(events->is_closed());
    transfer->close();
}

TEST_CASE("closing before metadata yields added then closed")
{
    auto transfer = FakeTransfer::with_layout("c5", {10}, 5);
    auto tracker = TransferTracker::create(transfer);
    auto cancel = make_cancel_token();
    auto events = EventStream::open(tracker, cancel, 4);
    transfer->close();
    auto received = drain(*events);
    CHECK(types_of(received) ==
          std::vector<EventType>{EventType::Added, EventType::Closed});
}

TEST_CASE("closing mid-download ends the piece stream with closed")
{
    auto transfer = FakeTransfer::with_layout("c6", {10, 10}, 10);
    auto tracker = TransferTracker::create(transfer);
    transfer->publish_info();
    auto cancel = make_cancel_token();
    auto events = EventStream::open(tracker, cancel, 8);
    transfer->complete_piece(1);
    REQUIRE(closes_soon(*tracker->file_done("fake/file1")));
    transfer->close();

    auto received = drain(*events);
    CHECK(types_of(received) ==
          std::vector<EventType>{EventType::Added, EventType::GotInfo,
                                 EventType::PieceDone, EventType::FileDone,
                                 EventType::Closed});
}

TEST_CASE("start shares a sink between streams and leaves it open")
{
    auto first = FakeTransfer::with_layout("c7", {4}, 4);
    auto second = FakeTransfer::with_layout("c8", {4}, 4);
    auto first_tracker = TransferTracker::create(first);
    auto second_tracker = TransferTracker::create(second);
    auto cancel = make_cancel_token();
    auto sink = std::make_shared<tl::engine::EventChannel>(0);
    EventStream::start(first_tracker, cancel, sink);
    EventStream::start(second_tracker, cancel, sink);

    first->close();
    second->close();
    auto received = take(*sink, 4);
    REQUIRE(received.size() == 4);
    int closed = 0;
    for (auto const &event : received)
    {
        if (event.type == EventType::Closed)
        {
            ++closed;
        }
    }
    CHECK(closed == 2);
    CHECK_FALSE(sink->is_closed());
    cancel->close();
}
