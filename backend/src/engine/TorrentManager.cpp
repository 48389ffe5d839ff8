#include "engine/TorrentManager.hpp"
#include "engine/TorrentUtils.hpp"

#include "utils/Log.hpp"

#include <chrono>
#include <exception>
#include <utility>

namespace tl::engine
{

TorrentManager::TorrentManager()
{
    alert_buffer_.reserve(kAlertBufferCapacity);
}

TorrentManager::~TorrentManager()
{
    close_all_transfers();
    if (session_)
    {
        session_->pause();
        session_.reset();
    }
}

void TorrentManager::start_session(libtorrent::session_params params)
{
    session_ = std::make_unique<libtorrent::session>(std::move(params));
}

void TorrentManager::enqueue_task(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(task_mutex_);
        while (tasks_.size() >= kMaxPendingTasks)
        {
            TL_LOG_INFO(
                "task queue maxed out ({}); waiting for engine to catch up",
                tasks_.size());
            task_space_cv_.wait(lock, [this]
                                { return tasks_.size() < kMaxPendingTasks; });
        }
        tasks_.push_back(std::move(task));
    }
    wake_cv_.notify_one();
}

void TorrentManager::process_tasks()
{
    std::deque<std::function<void()>> pending;
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        pending.swap(tasks_);
    }
    task_space_cv_.notify_all();
    if (pending.empty())
    {
        return;
    }
    TL_LOG_DEBUG("Processing {} pending engine commands", pending.size());
    for (auto &task : pending)
    {
        try
        {
            task();
        }
        catch (std::exception const &ex)
        {
            TL_LOG_ERROR("engine task failed: {}", ex.what());
        }
    }
}

void TorrentManager::wait_for_work(unsigned idle_sleep_ms,
                                   std::atomic_bool const &shutdown_requested)
{
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_cv_.wait_for(lock, std::chrono::milliseconds(idle_sleep_ms),
                      [&]
                      {
                          std::lock_guard<std::mutex> tasks_lock(task_mutex_);
                          return !tasks_.empty() ||
                                 shutdown_requested.load(
                                     std::memory_order_relaxed);
                      });
}

void TorrentManager::notify()
{
    wake_cv_.notify_one();
}

void TorrentManager::set_transfer_added_callback(TransferCallback callback)
{
    on_transfer_added_ = std::move(callback);
}

void TorrentManager::set_seed_after_download(bool enabled)
{
    seed_after_download_.store(enabled, std::memory_order_relaxed);
    std::vector<std::shared_ptr<LibtorrentTransfer>> live;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        live.reserve(transfers_.size());
        for (auto const &[hash, entry] : transfers_)
        {
            live.push_back(entry);
        }
    }
    for (auto const &entry : live)
    {
        entry->set_seed_after_download(enabled);
    }
}

void TorrentManager::process_alerts()
{
    if (!session_)
    {
        return;
    }
    alert_buffer_.clear();
    session_->pop_alerts(&alert_buffer_);
    for (auto const *alert : alert_buffer_)
    {
        if (auto *added =
                libtorrent::alert_cast<libtorrent::add_torrent_alert>(alert))
        {
            handle_add_torrent_alert(*added);
        }
        else if (auto *metadata = libtorrent::alert_cast<
                     libtorrent::metadata_received_alert>(alert))
        {
            handle_metadata_received_alert(*metadata);
        }
        else if (auto *piece =
                     libtorrent::alert_cast<libtorrent::piece_finished_alert>(
                         alert))
        {
            handle_piece_finished_alert(*piece);
        }
        else if (auto *finished =
                     libtorrent::alert_cast<libtorrent::torrent_finished_alert>(
                         alert))
        {
            handle_torrent_finished_alert(*finished);
        }
        else if (auto *removed =
                     libtorrent::alert_cast<libtorrent::torrent_removed_alert>(
                         alert))
        {
            handle_torrent_removed_alert(*removed);
        }
        else if (auto *metadata_failed =
                     libtorrent::alert_cast<libtorrent::metadata_failed_alert>(
                         alert))
        {
            TL_LOG_WARN("metadata failed: {}", metadata_failed->message());
        }
        else if (auto *file_error =
                     libtorrent::alert_cast<libtorrent::file_error_alert>(
                         alert))
        {
            TL_LOG_WARN("file error: {}", file_error->message());
        }
        else if (auto *listen =
                     libtorrent::alert_cast<libtorrent::listen_failed_alert>(
                         alert))
        {
            TL_LOG_ERROR("listen failed: {}", listen->message());
        }
        else if (auto *listening =
                     libtorrent::alert_cast<libtorrent::listen_succeeded_alert>(
                         alert))
        {
            TL_LOG_INFO("{}", listening->message());
        }
    }
}

void TorrentManager::async_add_torrent(libtorrent::add_torrent_params params)
{
    enqueue_task(
        [this, params = std::move(params)]() mutable
        {
            if (session_)
            {
                session_->async_add_torrent(std::move(params));
            }
        });
}

bool TorrentManager::remove_torrent(std::string const &hash, bool delete_data)
{
    auto target = transfer(hash);
    if (!target)
    {
        return false;
    }
    enqueue_task(
        [this, handle = target->handle(), delete_data]
        {
            if (!session_ || !handle.is_valid())
            {
                return;
            }
            auto flags = libtorrent::remove_flags_t{};
            if (delete_data)
            {
                flags = libtorrent::session::delete_files;
            }
            session_->remove_torrent(handle, flags);
        });
    return true;
}

void TorrentManager::apply_settings(libtorrent::settings_pack const &pack)
{
    if (session_)
    {
        session_->apply_settings(pack);
    }
}

std::shared_ptr<LibtorrentTransfer>
TorrentManager::transfer(std::string const &hash) const
{
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    auto it = transfers_.find(hash);
    return it == transfers_.end() ? nullptr : it->second;
}

void TorrentManager::close_all_transfers()
{
    std::unordered_map<std::string, std::shared_ptr<LibtorrentTransfer>>
        closing;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        closing.swap(transfers_);
    }
    for (auto const &[hash, entry] : closing)
    {
        entry->mark_closed();
    }
}

void TorrentManager::handle_add_torrent_alert(
    libtorrent::add_torrent_alert const &alert)
{
    if (alert.error)
    {
        TL_LOG_WARN("failed to add torrent: {}", alert.error.message());
        return;
    }
    auto hash = hash_from_handle(alert.handle);
    if (!hash)
    {
        return;
    }
    auto entry = std::make_shared<LibtorrentTransfer>(
        alert.handle, *hash,
        seed_after_download_.load(std::memory_order_relaxed));
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        if (!transfers_.emplace(*hash, entry).second)
        {
            return;
        }
    }
    if (alert.handle.torrent_file())
    {
        entry->mark_metadata_received();
    }
    TL_LOG_INFO("added torrent {}", *hash);
    if (on_transfer_added_)
    {
        on_transfer_added_(entry);
    }
}

void TorrentManager::handle_metadata_received_alert(
    libtorrent::metadata_received_alert const &alert)
{
    if (auto entry = transfer_for_handle(alert.handle); entry)
    {
        entry->mark_metadata_received();
    }
}

void TorrentManager::handle_piece_finished_alert(
    libtorrent::piece_finished_alert const &alert)
{
    if (auto entry = transfer_for_handle(alert.handle); entry)
    {
        entry->publish_piece_finished(static_cast<int>(alert.piece_index));
    }
}

void TorrentManager::handle_torrent_finished_alert(
    libtorrent::torrent_finished_alert const &alert)
{
    if (auto entry = transfer_for_handle(alert.handle); entry)
    {
        entry->mark_finished();
    }
}

void TorrentManager::handle_torrent_removed_alert(
    libtorrent::torrent_removed_alert const &alert)
{
    auto const hash = info_hash_to_hex(alert.info_hashes);
    std::shared_ptr<LibtorrentTransfer> entry;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        auto it = transfers_.find(hash);
        if (it == transfers_.end())
        {
            return;
        }
        entry = std::move(it->second);
        transfers_.erase(it);
    }
    entry->mark_closed();
    TL_LOG_INFO("removed torrent {}", hash);
}

std::shared_ptr<LibtorrentTransfer> TorrentManager::transfer_for_handle(
    libtorrent::torrent_handle const &handle) const
{
    auto hash = hash_from_handle(handle);
    if (!hash)
    {
        return nullptr;
    }
    return transfer(*hash);
}

} // namespace tl::engine
