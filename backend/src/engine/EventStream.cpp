#include "engine/EventStream.hpp"

#include "utils/Log.hpp"

#include <exception>
#include <thread>
#include <utility>
#include <vector>

namespace tl::engine
{

namespace
{

struct Completion
{
    bool is_file = false;
    std::size_t position = 0;
};

// Unregisters every observer added through it when destroyed.
class ObserverSet
{
  public:
    ObserverSet() = default;
    ObserverSet(ObserverSet const &) = delete;
    ObserverSet &operator=(ObserverSet const &) = delete;

    ~ObserverSet()
    {
        for (auto const &[signal, id] : entries_)
        {
            signal->remove_observer(id);
        }
    }

    void add(std::shared_ptr<CompletionSignal const> signal,
             CompletionSignal::Callback callback)
    {
        auto id = signal->on_close(std::move(callback));
        if (id != 0)
        {
            entries_.emplace_back(std::move(signal), id);
        }
    }

  private:
    std::vector<std::pair<std::shared_ptr<CompletionSignal const>,
                          CompletionSignal::ObserverId>>
        entries_;
};

} // namespace

std::shared_ptr<EventChannel>
EventStream::open(std::shared_ptr<TransferTracker> tracker, CancelToken cancel,
                  std::size_t capacity)
{
    auto channel = std::make_shared<EventChannel>(capacity);
    std::thread(
        [stream = EventStream(std::move(tracker), std::move(cancel), channel),
         channel]() mutable
        {
            stream.run();
            channel->close();
        })
        .detach();
    return channel;
}

void EventStream::start(std::shared_ptr<TransferTracker> tracker,
                        CancelToken cancel, std::shared_ptr<EventChannel> sink)
{
    std::thread([stream = EventStream(std::move(tracker), std::move(cancel),
                                      std::move(sink))]() mutable
                { stream.run(); })
        .detach();
}

EventStream::EventStream(std::shared_ptr<TransferTracker> tracker,
                         CancelToken cancel,
                         std::shared_ptr<EventChannel> sink)
    : tracker_(std::move(tracker)), cancel_(std::move(cancel)),
      sink_(std::move(sink))
{
}

void EventStream::run()
{
    try
    {
        if (!advance(tracker_->added(), EventType::Added) ||
            !advance(tracker_->got_info(), EventType::GotInfo))
        {
            return;
        }

        switch (await(tracker_->signals_ready()))
        {
        case Stage::Cancelled:
            return;
        case Stage::Closed:
            emit(make_event(EventType::Closed));
            return;
        case Stage::Reached:
            break;
        }

        if (!stream_pieces_and_files() ||
            !advance(tracker_->download_done(), EventType::DownloadDone) ||
            !advance(tracker_->seeding_done(), EventType::SeedingDone))
        {
            return;
        }

        if (await(tracker_->closed()) == Stage::Reached)
        {
            emit(make_event(EventType::Closed));
        }
    }
    catch (std::exception const &ex)
    {
        TL_LOG_ERROR("event stream for {} failed: {}",
                     tracker_->transfer()->info_hash(), ex.what());
    }
}

EventStream::Stage EventStream::await(CompletionSignal const &expected) const
{
    switch (wait_any({cancel_.get(), &expected, &tracker_->closed()}))
    {
    case 0:
        return Stage::Cancelled;
    case 1:
        return Stage::Reached;
    default:
        return Stage::Closed;
    }
}

bool EventStream::advance(CompletionSignal const &expected, EventType type)
{
    switch (await(expected))
    {
    case Stage::Cancelled:
        return false;
    case Stage::Closed:
        emit(make_event(EventType::Closed));
        return false;
    case Stage::Reached:
        break;
    }
    return emit(make_event(type));
}

bool EventStream::stream_pieces_and_files()
{
    auto const files = tracker_->files();
    auto const piece_count = tracker_->piece_count();

    // Files still waiting for a pieceDone, per file and per piece.
    std::vector<std::size_t> pieces_left(files.size(), 0);
    std::vector<std::vector<std::size_t>> piece_files(
        static_cast<std::size_t>(piece_count));
    for (std::size_t f = 0; f < files.size(); ++f)
    {
        for (int piece : tracker_->pieces_for_file(files[f].path))
        {
            piece_files[static_cast<std::size_t>(piece)].push_back(f);
            ++pieces_left[f];
        }
    }

    auto inbox = std::make_shared<Channel<Completion>>();
    ObserverSet observers;
    for (int i = 0; i < piece_count; ++i)
    {
        observers.add(tracker_->piece_done(i),
                      [inbox, i] {
                          inbox->send(
                              Completion{false, static_cast<std::size_t>(i)});
                      });
    }
    for (std::size_t f = 0; f < files.size(); ++f)
    {
        observers.add(tracker_->file_done(files[f].path),
                      [inbox, f] { inbox->send(Completion{true, f}); });
    }
    // Completions always close before the tracker does, so they are queued
    // ahead of this close.
    observers.add(std::shared_ptr<CompletionSignal const>(tracker_,
                                                          &tracker_->closed()),
                  [inbox] { inbox->close(); });

    std::vector<bool> file_signalled(files.size(), false);
    auto remaining =
        static_cast<std::size_t>(piece_count) + files.size();

    auto emit_file = [&](std::size_t f)
    {
        auto event = make_event(EventType::FileDone);
        event.file = files[f];
        --remaining;
        return emit(std::move(event));
    };

    while (remaining > 0)
    {
        auto completion = inbox->receive(*cancel_);
        if (!completion)
        {
            if (!cancel_->is_closed())
            {
                emit(make_event(EventType::Closed));
            }
            return false;
        }

        if (completion->is_file)
        {
            auto const f = completion->position;
            file_signalled[f] = true;
            if (pieces_left[f] == 0 && !emit_file(f))
            {
                return false;
            }
            continue;
        }

        auto event = make_event(EventType::PieceDone);
        event.piece = static_cast<int>(completion->position);
        --remaining;
        if (!emit(std::move(event)))
        {
            return false;
        }
        for (auto f : piece_files[completion->position])
        {
            if (--pieces_left[f] == 0 && file_signalled[f] && !emit_file(f))
            {
                return false;
            }
        }
    }
    return true;
}

bool EventStream::emit(Event event)
{
    return sink_->send(std::move(event), *cancel_);
}

Event EventStream::make_event(EventType type) const
{
    Event event;
    event.type = type;
    event.transfer = tracker_->transfer();
    return event;
}

} // namespace tl::engine
