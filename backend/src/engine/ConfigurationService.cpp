#include "engine/ConfigurationService.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <utility>

namespace tl::engine
{

namespace
{

constexpr char kSeedRatioKey[] = "seedRatio";
constexpr char kDropWhenDoneKey[] = "dropWhenDone";
constexpr char kDownloadPathKey[] = "downloadPath";
constexpr char kListenInterfaceKey[] = "listenInterface";
constexpr char kEventBufferKey[] = "eventBufferSize";
constexpr char kDhtEnabledKey[] = "dhtEnabled";

std::optional<int> parse_int_value(std::optional<std::string> const &value)
{
    if (!value)
    {
        return std::nullopt;
    }
    try
    {
        return std::stoi(*value);
    }
    catch (std::logic_error const &)
    {
        return std::nullopt;
    }
}

std::optional<double> parse_double_value(std::optional<std::string> const &value)
{
    if (!value)
    {
        return std::nullopt;
    }
    try
    {
        return std::stod(*value);
    }
    catch (std::logic_error const &)
    {
        return std::nullopt;
    }
}

std::optional<bool> parse_bool_value(std::optional<std::string> const &value)
{
    if (!value)
    {
        return std::nullopt;
    }
    auto const &content = *value;
    return content == "1" || content == "true" || content == "True";
}

} // namespace

ConfigurationService::ConfigurationService(
    std::shared_ptr<storage::Database> database, ServiceSettings defaults)
    : database_(std::move(database)), settings_(std::move(defaults))
{
}

ServiceSettings ConfigurationService::get() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return settings_;
}

void ConfigurationService::load_persisted()
{
    if (!database_ || !database_->is_valid())
    {
        return;
    }
    auto read = [this](char const *key) { return database_->get_setting(key); };

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (auto value = parse_double_value(read(kSeedRatioKey)))
    {
        settings_.seed_ratio = *value;
    }
    if (auto value = parse_bool_value(read(kDropWhenDoneKey)))
    {
        settings_.drop_when_done = *value;
    }
    if (auto value = read(kDownloadPathKey); value && !value->empty())
    {
        settings_.download_path = *value;
    }
    if (auto value = read(kListenInterfaceKey); value && !value->empty())
    {
        settings_.listen_interface = *value;
    }
    if (auto value = parse_int_value(read(kEventBufferKey)))
    {
        settings_.event_buffer_size =
            static_cast<std::size_t>(std::max(0, *value));
    }
    if (auto value = parse_bool_value(read(kDhtEnabledKey)))
    {
        settings_.dht_enabled = *value;
    }
}

template <typename Mutator> void ConfigurationService::modify(Mutator &&mutator)
{
    ServiceSettings copy;
    ChangeListener listener;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (!mutator(settings_))
        {
            return;
        }
        copy = settings_;
        listener = listener_;
    }
    dirty_.store(true, std::memory_order_release);
    if (listener)
    {
        listener(copy);
    }
}

void ConfigurationService::set_seed_ratio(double ratio)
{
    modify(
        [ratio](ServiceSettings &s)
        {
            if (s.seed_ratio == ratio)
                return false;
            s.seed_ratio = ratio;
            return true;
        });
}

void ConfigurationService::set_drop_when_done(bool enabled)
{
    modify(
        [enabled](ServiceSettings &s)
        {
            if (s.drop_when_done == enabled)
                return false;
            s.drop_when_done = enabled;
            return true;
        });
}

void ConfigurationService::set_download_path(std::filesystem::path const &path)
{
    modify(
        [&path](ServiceSettings &s)
        {
            if (s.download_path == path)
                return false;
            s.download_path = path;
            return true;
        });
}

void ConfigurationService::set_listen_interface(std::string const &value)
{
    if (value.empty())
    {
        return;
    }
    auto normalized = value;
    if (normalized.find(':') == std::string::npos)
    {
        normalized += ":6881";
    }
    if (normalized.front() == ':')
    {
        normalized.insert(0, "0.0.0.0");
    }
    modify(
        [&normalized](ServiceSettings &s)
        {
            if (s.listen_interface == normalized)
                return false;
            s.listen_interface = normalized;
            return true;
        });
}

void ConfigurationService::set_event_buffer_size(std::size_t size)
{
    modify(
        [size](ServiceSettings &s)
        {
            if (s.event_buffer_size == size)
                return false;
            s.event_buffer_size = size;
            return true;
        });
}

void ConfigurationService::set_dht_enabled(bool enabled)
{
    modify(
        [enabled](ServiceSettings &s)
        {
            if (s.dht_enabled == enabled)
                return false;
            s.dht_enabled = enabled;
            return true;
        });
}

void ConfigurationService::set_change_listener(ChangeListener listener)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void ConfigurationService::persist_if_dirty()
{
    if (!dirty_.load(std::memory_order_acquire))
        return;
    persist_now();
}

bool ConfigurationService::persist_now()
{
    if (!database_ || !database_->is_valid())
        return false;

    auto const s = get();
    if (!database_->begin_transaction())
    {
        TL_LOG_WARN("failed to begin settings transaction");
        return false;
    }
    bool success = true;
    auto set_string = [&](char const *key, std::string const &value)
    { success = success && database_->set_setting(key, value); };

    set_string(kSeedRatioKey, std::to_string(s.seed_ratio));
    set_string(kDropWhenDoneKey, s.drop_when_done ? "1" : "0");
    set_string(kDownloadPathKey, s.download_path.string());
    set_string(kListenInterfaceKey, s.listen_interface);
    set_string(kEventBufferKey, std::to_string(s.event_buffer_size));
    set_string(kDhtEnabledKey, s.dht_enabled ? "1" : "0");

    if (!success)
    {
        if (!database_->rollback_transaction())
        {
            TL_LOG_ERROR("failed to roll back settings transaction");
        }
        TL_LOG_INFO("failed to persist settings");
        return false;
    }
    if (!database_->commit_transaction())
    {
        TL_LOG_INFO("failed to commit settings");
        return false;
    }
    dirty_.store(false, std::memory_order_release);
    return true;
}

} // namespace tl::engine
