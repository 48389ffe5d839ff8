#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace tl::engine
{

// One-shot broadcast latch. Any number of threads may wait on it; the first
// close() releases all of them and every later close() is a no-op.
class CompletionSignal
{
  public:
    using Callback = std::function<void()>;
    using ObserverId = std::uint64_t;

    CompletionSignal() = default;
    CompletionSignal(CompletionSignal const &) = delete;
    CompletionSignal &operator=(CompletionSignal const &) = delete;

    // Returns true for the call that actually closed the signal.
    bool close();
    bool is_closed() const noexcept
    {
        return closed_.load(std::memory_order_acquire);
    }

    void wait() const;

    // Returns true if the signal is closed when the wait ends.
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return is_closed(); });
    }

    // Runs callback once the signal closes: on the closing thread, or right
    // away on the calling thread when already closed (the returned id is then
    // 0). Callbacks run without any signal lock held.
    ObserverId on_close(Callback callback) const;
    void remove_observer(ObserverId id) const;

  private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic<bool> closed_{false};
    mutable std::vector<std::pair<ObserverId, Callback>> observers_;
    mutable ObserverId next_observer_ = 1;
};

using SignalPtr = std::shared_ptr<CompletionSignal>;

// Cancellation input shared by every worker that feeds one subscriber.
using CancelToken = std::shared_ptr<CompletionSignal>;

inline CancelToken make_cancel_token()
{
    return std::make_shared<CompletionSignal>();
}

using SignalList = std::initializer_list<CompletionSignal const *>;

// Blocks until one of the signals closes and returns its position in the
// list. When several are already closed, the earliest in the list wins.
std::size_t wait_any(SignalList signals);

std::optional<std::size_t> wait_any_for(SignalList signals,
                                        std::chrono::milliseconds timeout);

} // namespace tl::engine
