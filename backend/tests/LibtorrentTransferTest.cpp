#include "engine/LibtorrentTransfer.hpp"

#include <libtorrent/torrent_handle.hpp>

#include <doctest/doctest.h>

using tl::engine::LibtorrentTransfer;

namespace
{

constexpr char kHash[] = "00112233445566778899aabbccddeeff00112233";

} // namespace

TEST_CASE("finished transfer stops seeding when seeding is disabled")
{
    LibtorrentTransfer transfer(libtorrent::torrent_handle{}, kHash, false);
    CHECK_FALSE(transfer.seeding());
    transfer.mark_finished();
    CHECK_FALSE(transfer.seeding());

    // Enabling seeding later resumes the finished transfer.
    transfer.set_seed_after_download(true);
    CHECK(transfer.seeding());

    transfer.set_seed_after_download(false);
    CHECK_FALSE(transfer.seeding());
}

TEST_CASE("seeding transfer keeps seeding after it finishes")
{
    LibtorrentTransfer transfer(libtorrent::torrent_handle{}, kHash, true);
    CHECK(transfer.seeding());
    transfer.mark_finished();
    CHECK(transfer.seeding());

    transfer.mark_closed();
    CHECK_FALSE(transfer.seeding());
}

TEST_CASE("disabling seeding before the download finishes takes effect at finish")
{
    LibtorrentTransfer transfer(libtorrent::torrent_handle{}, kHash, true);
    transfer.set_seed_after_download(false);
    CHECK_FALSE(transfer.seeding());
    transfer.set_seed_after_download(true);
    CHECK(transfer.seeding());
    transfer.mark_finished();
    CHECK(transfer.seeding());
}

TEST_CASE("unbound transfer reports no geometry and closes its feeds")
{
    LibtorrentTransfer transfer(libtorrent::torrent_handle{}, kHash, false);
    CHECK(transfer.info_hash() == kHash);
    CHECK(transfer.name().empty());
    CHECK(transfer.files().empty());
    CHECK(transfer.num_pieces() == 0);
    CHECK(transfer.bytes_completed() == 0);

    auto feed = transfer.subscribe_piece_changes();
    CHECK_FALSE(feed->is_closed());
    transfer.mark_metadata_received();
    CHECK(transfer.got_info().is_closed());
    transfer.mark_closed();
    CHECK(feed->is_closed());
    CHECK(transfer.subscribe_piece_changes()->is_closed());
}
