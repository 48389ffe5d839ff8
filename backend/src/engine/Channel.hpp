#pragma once

#include "engine/CompletionSignal.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace tl::engine
{

// Multi-producer, multi-consumer hand-off queue. A capacity of 0 means the
// queue never blocks senders. Closing wakes every waiter; receivers drain
// whatever was queued before the close.
template <typename T> class Channel
{
  public:
    explicit Channel(std::size_t capacity = 0)
        : state_(std::make_shared<State>())
    {
        state_->capacity = capacity;
    }

    Channel(Channel const &) = delete;
    Channel &operator=(Channel const &) = delete;

    // Returns false when the channel is closed.
    bool send(T value)
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait(lock, [this] { return state_->closed || has_space(); });
        if (state_->closed)
        {
            return false;
        }
        state_->queue.push_back(std::move(value));
        lock.unlock();
        state_->cv.notify_all();
        return true;
    }

    // Returns false when the channel is closed or cancel fired while waiting
    // for space.
    bool send(T value, CompletionSignal const &cancel)
    {
        CancelWatch watch(cancel, state_);
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait(lock,
                        [&]
                        {
                            return state_->closed || cancel.is_closed() ||
                                   has_space();
                        });
        if (state_->closed || cancel.is_closed())
        {
            return false;
        }
        state_->queue.push_back(std::move(value));
        lock.unlock();
        state_->cv.notify_all();
        return true;
    }

    // Blocks until a value arrives; nullopt once closed and drained.
    std::optional<T> receive()
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait(lock, [this]
                        { return state_->closed || !state_->queue.empty(); });
        return pop_locked(lock);
    }

    std::optional<T> receive(CompletionSignal const &cancel)
    {
        CancelWatch watch(cancel, state_);
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait(lock,
                        [&]
                        {
                            return state_->closed || cancel.is_closed() ||
                                   !state_->queue.empty();
                        });
        if (cancel.is_closed())
        {
            return std::nullopt;
        }
        return pop_locked(lock);
    }

    template <typename Rep, typename Period>
    std::optional<T> receive_for(std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait_for(lock, timeout,
                            [this] {
                                return state_->closed ||
                                       !state_->queue.empty();
                            });
        return pop_locked(lock);
    }

    std::optional<T> try_receive()
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return pop_locked(lock);
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->closed = true;
        }
        state_->cv.notify_all();
    }

    bool is_closed() const
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->closed;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->queue.size();
    }

  private:
    struct State
    {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<T> queue;
        std::size_t capacity = 0;
        bool closed = false;
    };

    // Wakes this channel's waiters when cancel closes, for as long as the
    // watch is alive.
    class CancelWatch
    {
      public:
        CancelWatch(CompletionSignal const &cancel,
                    std::shared_ptr<State> const &state)
            : cancel_(cancel)
        {
            id_ = cancel_.on_close(
                [state]
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    state->cv.notify_all();
                });
        }
        ~CancelWatch() { cancel_.remove_observer(id_); }

        CancelWatch(CancelWatch const &) = delete;
        CancelWatch &operator=(CancelWatch const &) = delete;

      private:
        CompletionSignal const &cancel_;
        CompletionSignal::ObserverId id_ = 0;
    };

    bool has_space() const
    {
        return state_->capacity == 0 ||
               state_->queue.size() < state_->capacity;
    }

    std::optional<T> pop_locked(std::unique_lock<std::mutex> &lock)
    {
        if (state_->queue.empty())
        {
            return std::nullopt;
        }
        std::optional<T> value(std::move(state_->queue.front()));
        state_->queue.pop_front();
        lock.unlock();
        state_->cv.notify_all();
        return value;
    }

    std::shared_ptr<State> state_;
};

} // namespace tl::engine
