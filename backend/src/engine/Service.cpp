#include "engine/Service.hpp"

#include "engine/TorrentManager.hpp"
#include "engine/TorrentUtils.hpp"
#include "utils/Log.hpp"
#include "utils/Version.hpp"

#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/session_params.hpp>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/torrent_info.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <mutex>
#include <shared_mutex>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>

namespace tl::engine
{

namespace
{

libtorrent::settings_pack build_settings_pack(ServiceSettings const &s)
{
    libtorrent::settings_pack pack;
    pack.set_int(libtorrent::settings_pack::alert_mask,
                 libtorrent::alert_category::all);
    pack.set_str(libtorrent::settings_pack::user_agent,
                 tl::version::kUserAgentVersion);
    pack.set_str(libtorrent::settings_pack::listen_interfaces,
                 s.listen_interface);
    pack.set_bool(libtorrent::settings_pack::enable_dht, s.dht_enabled);
    pack.set_int(libtorrent::settings_pack::alert_queue_size, 8192);
    return pack;
}

char const *to_string(Service::AddStatus status)
{
    switch (status)
    {
    case Service::AddStatus::Ok:
        return "ok";
    case Service::AddStatus::InvalidUri:
        return "invalid uri";
    case Service::AddStatus::InvalidTorrentFile:
        return "invalid torrent file";
    case Service::AddStatus::AlreadyExists:
        return "already exists";
    case Service::AddStatus::EngineUnavailable:
        return "engine unavailable";
    }
    return "unknown";
}

} // namespace

struct Service::Impl
{
    std::shared_ptr<ConfigurationService> config;
    std::unique_ptr<TorrentManager> manager;
    FanoutRegistry registry;

    mutable std::shared_mutex trackers_mutex;
    std::unordered_map<std::string, std::shared_ptr<TransferTracker>> trackers;

    // Watchers run detached; shutdown() waits for the count to drain.
    mutable std::mutex watchers_mutex;
    std::condition_variable watchers_idle;
    std::size_t active_watchers = 0;

    mutable std::mutex remover_mutex;
    Remover remover;

    CancelToken stopping = make_cancel_token();
    std::atomic_bool shutdown_requested{false};
    std::atomic_bool running{false};

    Impl(std::shared_ptr<ConfigurationService> configuration,
         std::unique_ptr<TorrentManager> torrent_manager)
        : config(std::move(configuration)),
          manager(std::move(torrent_manager)),
          registry(config->get().event_buffer_size)
    {
        if (manager)
        {
            manager->set_transfer_added_callback(
                [this](std::shared_ptr<LibtorrentTransfer> const &transfer)
                {
                    if (!track(transfer))
                    {
                        TL_LOG_WARN("{} is already tracked",
                                    transfer->info_hash());
                    }
                });
        }
        config->set_change_listener([this](ServiceSettings const &)
                                    { apply_settings(); });
    }

    ~Impl()
    {
        config->set_change_listener({});
        shutdown();
        if (manager)
        {
            manager->set_transfer_added_callback({});
        }
    }

    std::shared_ptr<TransferTracker> track(std::shared_ptr<Transfer> transfer)
    {
        if (!transfer)
        {
            return nullptr;
        }
        auto const hash = transfer->info_hash();
        TrackerOptions options;
        options.seed_ratio = config->get().seed_ratio;

        std::shared_ptr<TransferTracker> tracker;
        {
            std::unique_lock<std::shared_mutex> lock(trackers_mutex);
            if (trackers.contains(hash))
            {
                return nullptr;
            }
            tracker = TransferTracker::create(std::move(transfer), options);
            trackers.emplace(hash, tracker);
        }
        registry.add(tracker);

        {
            std::lock_guard<std::mutex> lock(watchers_mutex);
            ++active_watchers;
        }
        std::thread(
            [this, tracker]
            {
                try
                {
                    watch(tracker);
                }
                catch (std::exception const &ex)
                {
                    TL_LOG_ERROR("watcher for {} failed: {}",
                                 tracker->transfer()->info_hash(), ex.what());
                }
                std::lock_guard<std::mutex> lock(watchers_mutex);
                --active_watchers;
                watchers_idle.notify_all();
            })
            .detach();
        TL_LOG_INFO("tracking {} (seed ratio {})", hash, options.seed_ratio);
        return tracker;
    }

    // Drops finished transfers when configured to and forgets closed ones.
    void watch(std::shared_ptr<TransferTracker> const &tracker)
    {
        auto const hash = tracker->transfer()->info_hash();
        auto const &halt = *stopping;
        if (wait_any({&halt, &tracker->seeding_done(), &tracker->closed()}) ==
                1 &&
            config->get().drop_when_done)
        {
            TL_LOG_INFO("{} is done; dropping", hash);
            auto status = drop(hash, false);
            if (status != DropStatus::Ok)
            {
                TL_LOG_WARN("could not drop {} after seeding", hash);
            }
        }
        if (wait_any({&halt, &tracker->closed()}) == 1)
        {
            std::unique_lock<std::shared_mutex> lock(trackers_mutex);
            auto it = trackers.find(hash);
            if (it != trackers.end() && it->second == tracker)
            {
                trackers.erase(it);
            }
        }
    }

    std::shared_ptr<TransferTracker> find(std::string const &hash) const
    {
        auto key = normalize_info_hash(hash).value_or(hash);
        std::shared_lock<std::shared_mutex> lock(trackers_mutex);
        auto it = trackers.find(key);
        return it == trackers.end() ? nullptr : it->second;
    }

    bool known(std::string const &hash) const
    {
        if (find(hash))
        {
            return true;
        }
        return manager && manager->transfer(hash) != nullptr;
    }

    AddStatus enqueue(libtorrent::add_torrent_params params)
    {
        auto const hash = info_hash_to_hex(params.info_hashes);
        if (known(hash))
        {
            return AddStatus::AlreadyExists;
        }
        if (!manager)
        {
            return AddStatus::EngineUnavailable;
        }
        auto const download_path = config->get().download_path;
        std::error_code ec;
        std::filesystem::create_directories(download_path, ec);
        if (ec)
        {
            TL_LOG_WARN("failed to create download directory {}: {}",
                        download_path.string(), ec.message());
        }
        params.save_path = download_path.string();
        manager->async_add_torrent(std::move(params));
        return AddStatus::Ok;
    }

    DropStatus drop(std::string const &hash, bool delete_files)
    {
        auto key = normalize_info_hash(hash);
        if (!key || !known(*key))
        {
            return DropStatus::NotFound;
        }
        if (manager)
        {
            if (!manager->remove_torrent(*key, delete_files))
            {
                return DropStatus::NotFound;
            }
            manager->notify();
            return DropStatus::Ok;
        }
        Remover remove;
        {
            std::lock_guard<std::mutex> lock(remover_mutex);
            remove = remover;
        }
        if (!remove)
        {
            return DropStatus::EngineUnavailable;
        }
        return remove(*key, delete_files) ? DropStatus::Ok
                                          : DropStatus::NotFound;
    }

    void apply_settings()
    {
        auto const s = config->get();
        std::size_t updated = 0;
        {
            std::shared_lock<std::shared_mutex> lock(trackers_mutex);
            for (auto const &[hash, tracker] : trackers)
            {
                if (tracker->set_seed_ratio(s.seed_ratio))
                {
                    ++updated;
                }
            }
        }
        if (manager)
        {
            manager->set_seed_after_download(s.seed_ratio > 0.0);
            manager->apply_settings(build_settings_pack(s));
        }
        TL_LOG_DEBUG("applied settings; seed ratio {} reached {} trackers",
                     s.seed_ratio, updated);
    }

    void stop() noexcept
    {
        shutdown_requested.store(true);
        stopping->close();
        if (manager)
        {
            manager->notify();
        }
    }

    void shutdown()
    {
        stop();
        if (manager)
        {
            manager->close_all_transfers();
        }
        std::unique_lock<std::mutex> lock(watchers_mutex);
        watchers_idle.wait(lock, [this] { return active_watchers == 0; });
    }
};

Service::Service(std::shared_ptr<ConfigurationService> config)
    : impl_(std::make_unique<Impl>(std::move(config), nullptr))
{
}

Service::Service(std::unique_ptr<Impl> impl) : impl_(std::move(impl))
{
}

Service::~Service() = default;

std::unique_ptr<Service>
Service::create(std::shared_ptr<ConfigurationService> config)
{
    auto const s = config->get();
    auto manager = std::make_unique<TorrentManager>();
    manager->set_seed_after_download(s.seed_ratio > 0.0);
    manager->start_session(libtorrent::session_params(build_settings_pack(s)));
    TL_LOG_INFO("session listening on {}", s.listen_interface);
    return std::unique_ptr<Service>(new Service(
        std::make_unique<Impl>(std::move(config), std::move(manager))));
}

void Service::run()
{
    impl_->running.store(true);
    auto const idle_ms = impl_->config->get().idle_sleep_ms;
    while (!impl_->shutdown_requested.load())
    {
        if (impl_->manager)
        {
            impl_->manager->process_tasks();
            impl_->manager->process_alerts();
        }
        impl_->config->persist_if_dirty();
        if (impl_->manager)
        {
            impl_->manager->wait_for_work(idle_ms, impl_->shutdown_requested);
        }
        else
        {
            impl_->stopping->wait_for(std::chrono::milliseconds(idle_ms));
        }
    }
    if (impl_->manager)
    {
        impl_->manager->process_tasks();
    }
    impl_->config->persist_if_dirty();
    impl_->running.store(false);
}

void Service::stop() noexcept
{
    impl_->stop();
}

bool Service::is_running() const noexcept
{
    return impl_->running.load();
}

std::shared_ptr<TransferTracker>
Service::track(std::shared_ptr<Transfer> transfer)
{
    return impl_->track(std::move(transfer));
}

std::shared_ptr<TransferTracker>
Service::tracker(std::string const &hash) const
{
    return impl_->find(hash);
}

std::vector<std::shared_ptr<TransferTracker>> Service::trackers() const
{
    std::shared_lock<std::shared_mutex> lock(impl_->trackers_mutex);
    std::vector<std::shared_ptr<TransferTracker>> result;
    result.reserve(impl_->trackers.size());
    for (auto const &[hash, tracker] : impl_->trackers)
    {
        result.push_back(tracker);
    }
    return result;
}

FanoutRegistry &Service::registry() noexcept
{
    return impl_->registry;
}

std::shared_ptr<EventChannel> Service::events(CancelToken cancel)
{
    return impl_->registry.events(std::move(cancel));
}

Service::AddStatus Service::add_magnet(std::string const &uri)
{
    if (!is_magnet_uri(uri))
    {
        return AddStatus::InvalidUri;
    }
    libtorrent::error_code ec;
    auto params = libtorrent::parse_magnet_uri(uri, ec);
    if (ec)
    {
        TL_LOG_WARN("rejecting magnet link: {}", ec.message());
        return AddStatus::InvalidUri;
    }
    auto status = impl_->enqueue(std::move(params));
    TL_LOG_INFO("add magnet: {}", to_string(status));
    return status;
}

Service::AddStatus
Service::add_torrent_file(std::filesystem::path const &path)
{
    libtorrent::error_code ec;
    auto info = std::make_shared<libtorrent::torrent_info>(path.string(), ec);
    if (ec)
    {
        TL_LOG_WARN("rejecting torrent file {}: {}", path.string(),
                    ec.message());
        return AddStatus::InvalidTorrentFile;
    }
    libtorrent::add_torrent_params params;
    params.info_hashes = info->info_hashes();
    params.ti = std::move(info);
    auto status = impl_->enqueue(std::move(params));
    TL_LOG_INFO("add torrent file {}: {}", path.string(), to_string(status));
    return status;
}

Service::DropStatus Service::drop(std::string const &hash, bool delete_files)
{
    return impl_->drop(hash, delete_files);
}

void Service::apply_settings()
{
    impl_->apply_settings();
}

ServiceSettings Service::settings() const
{
    return impl_->config->get();
}

void Service::set_remover(Remover remover)
{
    std::lock_guard<std::mutex> lock(impl_->remover_mutex);
    impl_->remover = std::move(remover);
}

std::size_t Service::watcher_count() const
{
    std::lock_guard<std::mutex> lock(impl_->watchers_mutex);
    return impl_->active_watchers;
}

void Service::shutdown()
{
    impl_->shutdown();
}

} // namespace tl::engine
