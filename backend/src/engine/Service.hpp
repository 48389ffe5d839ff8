#pragma once

#include "engine/CompletionSignal.hpp"
#include "engine/ConfigurationService.hpp"
#include "engine/EventStream.hpp"
#include "engine/FanoutRegistry.hpp"
#include "engine/Transfer.hpp"
#include "engine/TransferTracker.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tl::engine
{

// Admits transfers, keeps one tracker per info hash and feeds the registry.
class Service
{
  public:
    enum class AddStatus
    {
        Ok,
        InvalidUri,
        InvalidTorrentFile,
        AlreadyExists,
        EngineUnavailable
    };

    enum class DropStatus
    {
        Ok,
        NotFound,
        EngineUnavailable
    };

    // Without an engine transfers only arrive via track().
    // Removes a transfer from whatever engine feeds track(); returns false
    // when the engine does not know the hash.
    using Remover =
        std::function<bool(std::string const &hash, bool delete_files)>;

    explicit Service(std::shared_ptr<ConfigurationService> config);
    ~Service();

    Service(Service const &) = delete;
    Service &operator=(Service const &) = delete;

    // Starts a libtorrent session configured from config.
    static std::unique_ptr<Service>
    create(std::shared_ptr<ConfigurationService> config);

    // Engine loop: pumps tasks and alerts until stop().
    void run();
    void stop() noexcept;
    bool is_running() const noexcept;

    // Returns null when a tracker for the same info hash already exists.
    std::shared_ptr<TransferTracker> track(std::shared_ptr<Transfer> transfer);
    std::shared_ptr<TransferTracker> tracker(std::string const &hash) const;
    std::vector<std::shared_ptr<TransferTracker>> trackers() const;

    FanoutRegistry &registry() noexcept;
    std::shared_ptr<EventChannel> events(CancelToken cancel);

    AddStatus add_magnet(std::string const &uri);
    AddStatus add_torrent_file(std::filesystem::path const &path);
    DropStatus drop(std::string const &hash, bool delete_files);
    // Handles drop() when no libtorrent session is attached.
    void set_remover(Remover remover);

    // Pushes the current configuration to the session and to trackers whose
    // seed phase has not started.
    void apply_settings();
    ServiceSettings settings() const;

    // Lifecycle watchers still running; one per tracker until it closes.
    std::size_t watcher_count() const;

    // Closes every transfer and waits for the lifecycle watchers.
    void shutdown();

  private:
    struct Impl;
    explicit Service(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace tl::engine
