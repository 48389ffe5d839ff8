#include "engine/LibtorrentTransfer.hpp"

#include "utils/Log.hpp"

#include <libtorrent/file_storage.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/torrent_flags.hpp>
#include <libtorrent/torrent_status.hpp>

#include <algorithm>
#include <utility>

namespace tl::engine
{

LibtorrentTransfer::LibtorrentTransfer(libtorrent::torrent_handle handle,
                                       std::string info_hash,
                                       bool seed_after_download)
    : handle_(std::move(handle)), info_hash_(std::move(info_hash)),
      seed_after_download_(seed_after_download)
{
}

LibtorrentTransfer::~LibtorrentTransfer()
{
    mark_closed();
}

std::shared_ptr<libtorrent::torrent_info const>
LibtorrentTransfer::metadata() const
{
    if (!got_info_.is_closed() || !handle_.is_valid())
    {
        return nullptr;
    }
    return handle_.torrent_file();
}

std::string LibtorrentTransfer::name() const
{
    if (auto info = metadata(); info)
    {
        return info->name();
    }
    if (!handle_.is_valid())
    {
        return {};
    }
    return handle_.status(libtorrent::torrent_handle::query_name).name;
}

std::string LibtorrentTransfer::magnet_link() const
{
    if (!handle_.is_valid())
    {
        return {};
    }
    return libtorrent::make_magnet_uri(handle_);
}

std::vector<FileInfo> LibtorrentTransfer::files() const
{
    auto info = metadata();
    if (!info)
    {
        return {};
    }
    auto const &storage = info->files();
    auto const root = info->name() + "/";
    bool const multi_file = storage.num_files() > 1;

    std::vector<FileInfo> result;
    result.reserve(static_cast<std::size_t>(storage.num_files()));
    for (auto index : storage.file_range())
    {
        FileInfo file;
        file.path = storage.file_path(index);
        file.display_path = file.path;
        if (multi_file && file.display_path.rfind(root, 0) == 0)
        {
            file.display_path.erase(0, root.size());
        }
        file.offset = storage.file_offset(index);
        file.length = storage.file_size(index);
        result.push_back(std::move(file));
    }
    return result;
}

int LibtorrentTransfer::num_pieces() const
{
    auto info = metadata();
    return info ? info->num_pieces() : 0;
}

PieceInfo LibtorrentTransfer::piece(int index) const
{
    PieceInfo result;
    result.index = index;
    auto info = metadata();
    if (!info || index < 0 || index >= info->num_pieces())
    {
        return result;
    }
    result.offset = static_cast<std::int64_t>(index) * info->piece_length();
    result.length = info->piece_size(libtorrent::piece_index_t(index));
    return result;
}

bool LibtorrentTransfer::piece_complete(int index) const
{
    if (!handle_.is_valid() || index < 0 || index >= num_pieces())
    {
        return false;
    }
    return handle_.have_piece(libtorrent::piece_index_t(index));
}

std::int64_t LibtorrentTransfer::length() const
{
    auto info = metadata();
    return info ? info->total_size() : 0;
}

std::int64_t LibtorrentTransfer::bytes_completed() const
{
    if (!handle_.is_valid())
    {
        return 0;
    }
    return handle_.status().total_wanted_done;
}

std::int64_t LibtorrentTransfer::bytes_missing() const
{
    if (!handle_.is_valid())
    {
        return length();
    }
    auto const status = handle_.status();
    return std::max<std::int64_t>(
        0, status.total_wanted - status.total_wanted_done);
}

bool LibtorrentTransfer::seeding() const
{
    return seed_after_download_.load() && !upload_stopped_.load() &&
           !closed_.is_closed();
}

void LibtorrentTransfer::set_seed_after_download(bool enabled)
{
    seed_after_download_.store(enabled);
    if (!finished_.load())
    {
        return;
    }
    if (enabled)
    {
        resume_uploading();
    }
    else
    {
        stop_uploading();
    }
}

void LibtorrentTransfer::mark_finished()
{
    finished_.store(true);
    if (!seed_after_download_.load())
    {
        stop_uploading();
    }
}

void LibtorrentTransfer::stop_uploading()
{
    if (upload_stopped_.exchange(true))
    {
        return;
    }
    if (!handle_.is_valid())
    {
        return;
    }
    // An auto-managed torrent would be resumed by the queue.
    handle_.unset_flags(libtorrent::torrent_flags::auto_managed);
    handle_.pause();
    TL_LOG_INFO("{} finished; seeding disabled, pausing", info_hash_);
}

void LibtorrentTransfer::resume_uploading()
{
    if (!upload_stopped_.exchange(false))
    {
        return;
    }
    if (!handle_.is_valid())
    {
        return;
    }
    handle_.set_flags(libtorrent::torrent_flags::auto_managed);
    handle_.resume();
    TL_LOG_INFO("{} resumed for seeding", info_hash_);
}

TransferStats LibtorrentTransfer::stats() const
{
    TransferStats stats;
    if (!handle_.is_valid())
    {
        return stats;
    }
    auto const status = handle_.status();
    stats.bytes_read = status.total_download;
    stats.bytes_written = status.total_upload;
    stats.data_bytes_read = status.all_time_download;
    stats.data_bytes_written = status.all_time_upload;
    stats.active_peers = status.num_peers;
    stats.total_peers = status.list_peers;
    return stats;
}

std::shared_ptr<PieceFeed> LibtorrentTransfer::subscribe_piece_changes()
{
    auto feed = std::make_shared<PieceFeed>();
    std::lock_guard<std::mutex> lock(feeds_mutex_);
    if (closed_.is_closed())
    {
        feed->close();
        return feed;
    }
    std::erase_if(feeds_, [](auto const &weak) { return weak.expired(); });
    feeds_.push_back(feed);
    return feed;
}

void LibtorrentTransfer::mark_metadata_received()
{
    if (got_info_.close())
    {
        TL_LOG_DEBUG("metadata ready for {}", info_hash_);
    }
}

void LibtorrentTransfer::publish_piece_finished(int index)
{
    std::lock_guard<std::mutex> lock(feeds_mutex_);
    for (auto const &weak : feeds_)
    {
        if (auto feed = weak.lock(); feed)
        {
            feed->send(PieceStateChange{index, true});
        }
    }
}

void LibtorrentTransfer::mark_closed()
{
    std::vector<std::weak_ptr<PieceFeed>> feeds;
    {
        std::lock_guard<std::mutex> lock(feeds_mutex_);
        feeds.swap(feeds_);
        // Flip closed under the lock so no feed subscribes after the sweep.
        closed_.close();
    }
    for (auto const &weak : feeds)
    {
        if (auto feed = weak.lock(); feed)
        {
            feed->close();
        }
    }
}

} // namespace tl::engine
