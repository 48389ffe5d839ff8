#pragma once

#include "utils/StateStore.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>

namespace tl::engine
{

struct ServiceSettings
{
    std::filesystem::path download_path{"data"};
    std::string listen_interface{"0.0.0.0:6881"};
    std::filesystem::path state_path;
    unsigned idle_sleep_ms = 500;
    // <= 0 disables seeding after the download completes.
    double seed_ratio = 0.0;
    bool drop_when_done = false;
    std::size_t event_buffer_size = 64;
    bool dht_enabled = true;
};

class ConfigurationService
{
  public:
    using ChangeListener = std::function<void(ServiceSettings const &)>;

    // database may be null; settings then live in memory only.
    ConfigurationService(std::shared_ptr<storage::Database> database,
                         ServiceSettings defaults);

    ServiceSettings get() const;

    // Replaces defaults with whatever the settings table holds.
    void load_persisted();

    void set_seed_ratio(double ratio);
    void set_drop_when_done(bool enabled);
    void set_download_path(std::filesystem::path const &path);
    void set_listen_interface(std::string const &value);
    void set_event_buffer_size(std::size_t size);
    void set_dht_enabled(bool enabled);

    void set_change_listener(ChangeListener listener);

    bool dirty() const noexcept
    {
        return dirty_.load(std::memory_order_acquire);
    }
    void persist_if_dirty();
    bool persist_now();

  private:
    template <typename Mutator> void modify(Mutator &&mutator);

    std::shared_ptr<storage::Database> database_;

    mutable std::shared_mutex mutex_;
    ServiceSettings settings_;
    ChangeListener listener_;

    std::atomic_bool dirty_{false};
};

} // namespace tl::engine
