#include "engine/Events.hpp"
#include "engine/TransferSnapshot.hpp"
#include "rpc/Serializer.hpp"
#include "utils/Json.hpp"

#include "FakeTransfer.hpp"

#include <string>

#include <doctest/doctest.h>
#include <yyjson.h>

using tl::engine::Event;
using tl::engine::EventType;
using tl::json::Document;
using tl::json::integer_member;
using tl::json::string_member;
using tl::test::FakeTransfer;

namespace
{

yyjson_val *member(yyjson_val *object, char const *key)
{
    return object ? yyjson_obj_get(object, key) : nullptr;
}

} // namespace

TEST_CASE("event before metadata carries only the transfer header")
{
    auto transfer = FakeTransfer::with_layout("e0", {10, 6}, 8);
    Event event;
    event.type = EventType::Added;
    event.transfer = transfer;

    auto doc = Document::parse(tl::rpc::serialize_event(event));
    REQUIRE(doc.is_valid());
    auto *body = member(doc.root(), "event");
    REQUIRE(body != nullptr);
    CHECK(string_member(body, "type") == "added");
    CHECK(member(body, "file") == nullptr);
    CHECK(member(body, "piece") == nullptr);

    auto *torrent = member(body, "torrent");
    REQUIRE(torrent != nullptr);
    CHECK(string_member(torrent, "infoHash") == "e0");
    CHECK(string_member(torrent, "magnetLink") == "magnet:?xt=urn:btih:e0");
    CHECK(yyjson_get_bool(member(torrent, "hasInfo")) == false);
    CHECK(integer_member(torrent, "numPieces") == 0);
    CHECK(yyjson_arr_size(member(torrent, "files")) == 0);
}

TEST_CASE("piece and file events carry their payload")
{
    auto transfer = FakeTransfer::with_layout("e1", {10, 6}, 8);
    transfer->publish_info();
    transfer->complete_piece(0);
    transfer->set_data_bytes_written(3);

    Event piece_event;
    piece_event.type = EventType::PieceDone;
    piece_event.transfer = transfer;
    piece_event.piece = 0;
    auto piece_doc = Document::parse(tl::rpc::serialize_event(piece_event));
    REQUIRE(piece_doc.is_valid());
    auto *piece_body = member(piece_doc.root(), "event");
    CHECK(string_member(piece_body, "type") == "pieceDone");
    CHECK(integer_member(piece_body, "piece") == 0);

    auto *torrent = member(piece_body, "torrent");
    CHECK(yyjson_get_bool(member(torrent, "hasInfo")));
    CHECK(integer_member(torrent, "length") == 16);
    CHECK(integer_member(torrent, "numPieces") == 2);
    CHECK(integer_member(torrent, "bytesCompleted") == 8);
    CHECK(integer_member(torrent, "bytesMissing") == 8);
    CHECK(integer_member(member(torrent, "stats"), "dataBytesWritten") == 3);
    CHECK(yyjson_arr_size(member(torrent, "files")) == 2);

    Event file_event;
    file_event.type = EventType::FileDone;
    file_event.transfer = transfer;
    file_event.file = transfer->files()[1];
    auto file_doc = Document::parse(tl::rpc::serialize_event(file_event));
    REQUIRE(file_doc.is_valid());
    auto *file = member(member(file_doc.root(), "event"), "file");
    REQUIRE(file != nullptr);
    CHECK(string_member(file, "path") == "fake/file1");
    CHECK(string_member(file, "displayPath") == "file1");
    CHECK(integer_member(file, "offset") == 10);
    CHECK(integer_member(file, "length") == 6);
    CHECK(member(member(file_doc.root(), "event"), "piece") == nullptr);

    transfer->close();
}

TEST_CASE("snapshot serializes under a torrent key")
{
    tl::engine::TransferSnapshot snapshot;
    snapshot.info_hash = "e2";
    snapshot.name = "ubuntu.iso";
    snapshot.seeding = true;
    auto doc = Document::parse(tl::rpc::serialize_transfer(snapshot));
    REQUIRE(doc.is_valid());
    auto *torrent = member(doc.root(), "torrent");
    CHECK(string_member(torrent, "name") == "ubuntu.iso");
    CHECK(yyjson_get_bool(member(torrent, "seeding")));
}

TEST_CASE("error payload escapes its message")
{
    auto doc = Document::parse(tl::rpc::serialize_error("bad \"uri\""));
    REQUIRE(doc.is_valid());
    CHECK(string_member(doc.root(), "error") == "bad \"uri\"");
}

TEST_CASE("event type names round-trip")
{
    for (auto type : {EventType::Added, EventType::GotInfo, EventType::PieceDone,
                      EventType::FileDone, EventType::DownloadDone,
                      EventType::SeedingDone, EventType::Closed})
    {
        CHECK(tl::engine::event_type_from_string(tl::engine::to_string(type)) ==
              type);
    }
    CHECK_FALSE(tl::engine::event_type_from_string("bogus").has_value());
}
