#pragma once

#include "engine/Transfer.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tl::engine
{

struct TransferSnapshot
{
    std::int64_t bytes_completed = 0;
    std::int64_t bytes_missing = 0;
    std::vector<FileInfo> files;
    std::string info_hash;
    std::int64_t length = 0;
    std::string magnet_link;
    std::string name;
    int num_pieces = 0;
    bool seeding = false;
    TransferStats stats;
    bool has_info = false;
};

TransferSnapshot snapshot_transfer(Transfer const &transfer);

} // namespace tl::engine
