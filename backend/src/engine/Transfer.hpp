#pragma once

#include "engine/Channel.hpp"
#include "engine/CompletionSignal.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tl::engine
{

struct FileInfo
{
    std::string path;
    std::string display_path;
    std::int64_t offset = 0;
    std::int64_t length = 0;
};

struct PieceInfo
{
    int index = 0;
    std::int64_t offset = 0;
    std::int64_t length = 0;
};

struct PieceStateChange
{
    int index = 0;
    bool complete = false;
};

struct TransferStats
{
    std::int64_t bytes_read = 0;
    std::int64_t bytes_written = 0;
    std::int64_t data_bytes_read = 0;
    // Payload bytes sent to peers; the numerator of the seed ratio.
    std::int64_t data_bytes_written = 0;
    int active_peers = 0;
    int total_peers = 0;
};

using PieceFeed = Channel<PieceStateChange>;

// Engine-side view of one transfer. Implementations own the signals and close
// every outstanding piece feed when the transfer closes.
class Transfer
{
  public:
    virtual ~Transfer() = default;

    virtual std::string info_hash() const = 0;
    virtual std::string name() const = 0;
    virtual std::string magnet_link() const = 0;

    virtual CompletionSignal const &got_info() const = 0;
    virtual CompletionSignal const &closed() const = 0;

    // Geometry; only meaningful once got_info() has closed.
    virtual std::vector<FileInfo> files() const = 0;
    virtual int num_pieces() const = 0;
    virtual PieceInfo piece(int index) const = 0;
    virtual bool piece_complete(int index) const = 0;
    virtual std::int64_t length() const = 0;

    virtual std::int64_t bytes_completed() const = 0;
    virtual std::int64_t bytes_missing() const = 0;
    virtual bool seeding() const = 0;
    virtual TransferStats stats() const = 0;

    // Unbounded feed of piece state changes. The subscription ends when the
    // caller drops the feed or the transfer closes it.
    virtual std::shared_ptr<PieceFeed> subscribe_piece_changes() = 0;
};

} // namespace tl::engine
