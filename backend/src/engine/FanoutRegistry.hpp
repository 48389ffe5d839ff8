#pragma once

#include "engine/Channel.hpp"
#include "engine/CompletionSignal.hpp"
#include "engine/EventStream.hpp"
#include "engine/TransferTracker.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace tl::engine
{

// Multiplexes the events of every registered tracker into one stream per
// subscriber. A subscriber sees each tracker registered before or after it
// subscribed exactly once.
class FanoutRegistry
{
  public:
    using Id = std::uint64_t;

    explicit FanoutRegistry(std::size_t subscriber_capacity = 64);

    FanoutRegistry(FanoutRegistry const &) = delete;
    FanoutRegistry &operator=(FanoutRegistry const &) = delete;

    // Registers until the tracker closes.
    Id add(std::shared_ptr<TransferTracker> tracker);

    // The returned channel closes once cancel fires.
    std::shared_ptr<EventChannel> events(CancelToken cancel);

    std::size_t size() const;
    std::size_t subscriber_count() const;

  private:
    using Relay = Channel<std::shared_ptr<TransferTracker>>;

    struct State
    {
        mutable std::shared_mutex mutex;
        std::unordered_map<Id, std::shared_ptr<TransferTracker>> trackers;
        std::unordered_map<Id, std::shared_ptr<Relay>> relays;
        Id next_tracker = 1;
        Id next_relay = 1;
    };

    std::shared_ptr<State> state_;
    std::size_t subscriber_capacity_;
};

} // namespace tl::engine
