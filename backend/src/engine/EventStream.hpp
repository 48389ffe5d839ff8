#pragma once

#include "engine/Channel.hpp"
#include "engine/CompletionSignal.hpp"
#include "engine/Events.hpp"
#include "engine/TransferTracker.hpp"

#include <cstddef>
#include <memory>

namespace tl::engine
{

using EventChannel = Channel<Event>;

// One subscriber's ordered view of a tracker:
// added, gotInfo, pieceDone/fileDone, downloadDone, seedingDone, closed.
// A fileDone always follows the pieceDone of every piece in the file. If the
// tracker closes early the stream emits closed and ends; if the subscriber
// cancels it ends without a closed event.
class EventStream
{
  public:
    // Streams into a fresh channel that is closed when the stream ends.
    static std::shared_ptr<EventChannel>
    open(std::shared_ptr<TransferTracker> tracker, CancelToken cancel,
         std::size_t capacity);

    // Streams into a shared sink; the sink is left open.
    static void start(std::shared_ptr<TransferTracker> tracker,
                      CancelToken cancel, std::shared_ptr<EventChannel> sink);

  private:
    enum class Stage
    {
        Reached,
        Closed,
        Cancelled,
    };

    EventStream(std::shared_ptr<TransferTracker> tracker, CancelToken cancel,
                std::shared_ptr<EventChannel> sink);

    void run();
    Stage await(CompletionSignal const &expected) const;
    // Returns false when the stream has ended.
    bool advance(CompletionSignal const &expected, EventType type);
    bool stream_pieces_and_files();
    bool emit(Event event);
    Event make_event(EventType type) const;

    std::shared_ptr<TransferTracker> tracker_;
    CancelToken cancel_;
    std::shared_ptr<EventChannel> sink_;
};

} // namespace tl::engine
