#include "engine/TransferSnapshot.hpp"

namespace tl::engine
{

TransferSnapshot snapshot_transfer(Transfer const &transfer)
{
    TransferSnapshot snapshot;
    snapshot.info_hash = transfer.info_hash();
    snapshot.name = transfer.name();
    snapshot.magnet_link = transfer.magnet_link();
    snapshot.seeding = transfer.seeding();
    snapshot.stats = transfer.stats();
    snapshot.bytes_completed = transfer.bytes_completed();
    snapshot.has_info = transfer.got_info().is_closed();
    if (!snapshot.has_info)
    {
        return snapshot;
    }
    snapshot.files = transfer.files();
    snapshot.num_pieces = transfer.num_pieces();
    snapshot.length = transfer.length();
    snapshot.bytes_missing = transfer.bytes_missing();
    return snapshot;
}

} // namespace tl::engine
