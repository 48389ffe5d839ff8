#include "engine/CompletionSignal.hpp"

#include <algorithm>

namespace tl::engine
{

namespace
{

struct Selection
{
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<std::size_t> first;
};

class SelectionGuard
{
  public:
    explicit SelectionGuard(SignalList signals)
        : signals_(signals), selection_(std::make_shared<Selection>())
    {
        std::size_t position = 0;
        for (auto const *signal : signals_)
        {
            auto id = signal->on_close(
                [selection = selection_, position]
                {
                    std::lock_guard<std::mutex> lock(selection->mutex);
                    if (!selection->first)
                    {
                        selection->first = position;
                    }
                    selection->cv.notify_all();
                });
            ids_.push_back(id);
            ++position;
            if (id == 0)
            {
                break;
            }
        }
    }

    ~SelectionGuard()
    {
        auto it = signals_.begin();
        for (auto id : ids_)
        {
            if (id != 0)
            {
                (*it)->remove_observer(id);
            }
            ++it;
        }
    }

    SelectionGuard(SelectionGuard const &) = delete;
    SelectionGuard &operator=(SelectionGuard const &) = delete;

    Selection &selection() noexcept { return *selection_; }

  private:
    SignalList signals_;
    std::shared_ptr<Selection> selection_;
    std::vector<CompletionSignal::ObserverId> ids_;
};

} // namespace

bool CompletionSignal::close()
{
    std::vector<std::pair<ObserverId, Callback>> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.load(std::memory_order_relaxed))
        {
            return false;
        }
        closed_.store(true, std::memory_order_release);
        observers.swap(observers_);
    }
    cv_.notify_all();
    for (auto &observer : observers)
    {
        observer.second();
    }
    return true;
}

void CompletionSignal::wait() const
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return is_closed(); });
}

CompletionSignal::ObserverId CompletionSignal::on_close(Callback callback) const
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_closed())
        {
            auto id = next_observer_++;
            observers_.emplace_back(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CompletionSignal::remove_observer(ObserverId id) const
{
    if (id == 0)
    {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(observers_.begin(), observers_.end(),
                           [id](auto const &entry) { return entry.first == id; });
    if (it != observers_.end())
    {
        observers_.erase(it);
    }
}

std::size_t wait_any(SignalList signals)
{
    SelectionGuard guard(signals);
    auto &selection = guard.selection();
    std::unique_lock<std::mutex> lock(selection.mutex);
    selection.cv.wait(lock, [&selection] { return selection.first.has_value(); });
    return *selection.first;
}

std::optional<std::size_t> wait_any_for(SignalList signals,
                                        std::chrono::milliseconds timeout)
{
    SelectionGuard guard(signals);
    auto &selection = guard.selection();
    std::unique_lock<std::mutex> lock(selection.mutex);
    selection.cv.wait_for(lock, timeout,
                          [&selection] { return selection.first.has_value(); });
    return selection.first;
}

} // namespace tl::engine
