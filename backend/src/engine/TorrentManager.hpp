#pragma once

#include "engine/LibtorrentTransfer.hpp"

#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/alert.hpp>
#include <libtorrent/alert_types.hpp>
#include <libtorrent/session.hpp>
#include <libtorrent/session_params.hpp>
#include <libtorrent/settings_pack.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tl::engine
{

// Owns the libtorrent session. Engine-thread work is queued as tasks; the
// owner drives process_tasks()/process_alerts() from its run loop.
class TorrentManager
{
  public:
    using TransferCallback =
        std::function<void(std::shared_ptr<LibtorrentTransfer> const &)>;

    TorrentManager();
    TorrentManager(TorrentManager const &) = delete;
    TorrentManager &operator=(TorrentManager const &) = delete;
    ~TorrentManager();

    void start_session(libtorrent::session_params params);

    void enqueue_task(std::function<void()> task);
    void process_tasks();
    void wait_for_work(unsigned idle_sleep_ms,
                       std::atomic_bool const &shutdown_requested);
    void notify();

    // Invoked on the engine thread for every transfer the session admits.
    void set_transfer_added_callback(TransferCallback callback);
    // Applies to new transfers and to every live one.
    void set_seed_after_download(bool enabled);

    void process_alerts();
    void async_add_torrent(libtorrent::add_torrent_params params);
    // Returns false when the hash is unknown.
    bool remove_torrent(std::string const &hash, bool delete_data);
    void apply_settings(libtorrent::settings_pack const &pack);

    std::shared_ptr<LibtorrentTransfer> transfer(std::string const &hash) const;
    void close_all_transfers();

  private:
    void handle_add_torrent_alert(libtorrent::add_torrent_alert const &alert);
    void handle_metadata_received_alert(
        libtorrent::metadata_received_alert const &alert);
    void handle_piece_finished_alert(
        libtorrent::piece_finished_alert const &alert);
    void handle_torrent_finished_alert(
        libtorrent::torrent_finished_alert const &alert);
    void handle_torrent_removed_alert(
        libtorrent::torrent_removed_alert const &alert);
    std::shared_ptr<LibtorrentTransfer>
    transfer_for_handle(libtorrent::torrent_handle const &handle) const;

    std::unique_ptr<libtorrent::session> session_;

    std::deque<std::function<void()>> tasks_;
    mutable std::mutex task_mutex_;
    std::condition_variable task_space_cv_;
    std::condition_variable wake_cv_;
    std::mutex wake_mutex_;

    TransferCallback on_transfer_added_;
    std::atomic_bool seed_after_download_{false};

    mutable std::mutex transfers_mutex_;
    std::unordered_map<std::string, std::shared_ptr<LibtorrentTransfer>>
        transfers_;

    static constexpr std::size_t kMaxPendingTasks = 4096;
    static constexpr std::size_t kAlertBufferCapacity = 65536;
    std::vector<libtorrent::alert *> alert_buffer_;
};

} // namespace tl::engine
