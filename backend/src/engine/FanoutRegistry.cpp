#include "engine/FanoutRegistry.hpp"

#include "utils/Log.hpp"

#include <mutex>
#include <thread>
#include <utility>

namespace tl::engine
{

FanoutRegistry::FanoutRegistry(std::size_t subscriber_capacity)
    : state_(std::make_shared<State>()),
      subscriber_capacity_(subscriber_capacity)
{
}

FanoutRegistry::Id FanoutRegistry::add(std::shared_ptr<TransferTracker> tracker)
{
    Id id = 0;
    {
        std::unique_lock<std::shared_mutex> lock(state_->mutex);
        id = state_->next_tracker++;
        state_->trackers.emplace(id, tracker);
        for (auto &[relay_id, relay] : state_->relays)
        {
            relay->send(tracker);
        }
    }

    std::weak_ptr<State> weak = state_;
    tracker->closed().on_close(
        [weak, id]
        {
            if (auto state = weak.lock())
            {
                std::unique_lock<std::shared_mutex> lock(state->mutex);
                state->trackers.erase(id);
            }
        });
    TL_LOG_DEBUG("registered tracker {} for {}", id,
                 tracker->transfer()->info_hash());
    return id;
}

std::shared_ptr<EventChannel> FanoutRegistry::events(CancelToken cancel)
{
    auto combined = std::make_shared<EventChannel>(subscriber_capacity_);
    auto relay = std::make_shared<Relay>();

    Id relay_id = 0;
    {
        std::unique_lock<std::shared_mutex> lock(state_->mutex);
        relay_id = state_->next_relay++;
        state_->relays.emplace(relay_id, relay);
        for (auto const &[id, tracker] : state_->trackers)
        {
            relay->send(tracker);
        }
    }

    std::weak_ptr<State> weak = state_;
    std::thread(
        [weak, relay_id, relay, combined, cancel = std::move(cancel)]
        {
            while (auto tracker = relay->receive(*cancel))
            {
                EventStream::start(std::move(*tracker), cancel, combined);
            }
            combined->close();
            if (auto state = weak.lock())
            {
                std::unique_lock<std::shared_mutex> lock(state->mutex);
                state->relays.erase(relay_id);
            }
        })
        .detach();
    return combined;
}

std::size_t FanoutRegistry::size() const
{
    std::shared_lock<std::shared_mutex> lock(state_->mutex);
    return state_->trackers.size();
}

std::size_t FanoutRegistry::subscriber_count() const
{
    std::shared_lock<std::shared_mutex> lock(state_->mutex);
    return state_->relays.size();
}

} // namespace tl::engine
