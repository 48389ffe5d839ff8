#pragma once

#include "engine/Transfer.hpp"

#include <libtorrent/torrent_handle.hpp>
#include <libtorrent/torrent_info.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tl::engine
{

// Transfer backed by a libtorrent handle. TorrentManager drives the signals
// and the piece feeds from the alert pump. When seeding after download is
// disabled the handle is paused once the download finishes, so seeding()
// mirrors whether the session keeps uploading.
class LibtorrentTransfer final : public Transfer
{
  public:
    LibtorrentTransfer(libtorrent::torrent_handle handle, std::string info_hash,
                       bool seed_after_download);
    ~LibtorrentTransfer() override;

    std::string info_hash() const override { return info_hash_; }
    std::string name() const override;
    std::string magnet_link() const override;

    CompletionSignal const &got_info() const override { return got_info_; }
    CompletionSignal const &closed() const override { return closed_; }

    std::vector<FileInfo> files() const override;
    int num_pieces() const override;
    PieceInfo piece(int index) const override;
    bool piece_complete(int index) const override;
    std::int64_t length() const override;

    std::int64_t bytes_completed() const override;
    std::int64_t bytes_missing() const override;
    bool seeding() const override;
    TransferStats stats() const override;

    std::shared_ptr<PieceFeed> subscribe_piece_changes() override;

    libtorrent::torrent_handle const &handle() const noexcept
    {
        return handle_;
    }

    // Pauses or resumes an already finished download to match.
    void set_seed_after_download(bool enabled);
    void mark_finished();

    void mark_metadata_received();
    void publish_piece_finished(int index);
    // Closes the transfer and every outstanding piece feed.
    void mark_closed();

  private:
    std::shared_ptr<libtorrent::torrent_info const> metadata() const;

    libtorrent::torrent_handle handle_;
    std::string info_hash_;
    std::atomic_bool seed_after_download_;
    std::atomic_bool finished_{false};
    // Set while the handle is paused because seeding is disabled.
    std::atomic_bool upload_stopped_{false};

    void stop_uploading();
    void resume_uploading();

    CompletionSignal got_info_;
    CompletionSignal closed_;

    std::mutex feeds_mutex_;
    std::vector<std::weak_ptr<PieceFeed>> feeds_;
};

} // namespace tl::engine
