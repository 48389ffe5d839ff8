#include "engine/TransferTracker.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <exception>
#include <thread>
#include <utility>

namespace tl::engine
{

std::chrono::milliseconds seed_wait(std::int64_t data_bytes_written,
                                    std::int64_t length, double seed_ratio,
                                    std::chrono::milliseconds floor,
                                    std::chrono::milliseconds span)
{
    if (length <= 0 || seed_ratio <= 0.0)
    {
        return std::chrono::milliseconds::zero();
    }
    auto const share = static_cast<double>(data_bytes_written) /
                       static_cast<double>(length) / seed_ratio;
    if (share > 1.0)
    {
        return std::chrono::milliseconds::zero();
    }
    auto const scaled = static_cast<std::chrono::milliseconds::rep>(
        (1.0 - share) * static_cast<double>(span.count()));
    return std::chrono::milliseconds(scaled) + floor;
}

std::shared_ptr<TransferTracker>
TransferTracker::create(std::shared_ptr<Transfer> transfer,
                        TrackerOptions options)
{
    std::shared_ptr<TransferTracker> tracker(
        new TransferTracker(std::move(transfer), options));
    auto feed = tracker->transfer_->subscribe_piece_changes();
    std::thread([tracker, feed = std::move(feed)]() mutable
                { tracker->run(std::move(feed)); })
        .detach();
    return tracker;
}

TransferTracker::TransferTracker(std::shared_ptr<Transfer> transfer,
                                 TrackerOptions options)
    : transfer_(std::move(transfer)), options_(options),
      seed_ratio_(options.seed_ratio)
{
    // Knowing about the transfer means it has been added.
    added_.close();
}

std::shared_ptr<CompletionSignal const>
TransferTracker::piece_done(int index) const
{
    std::shared_lock<std::shared_mutex> lock(signals_mutex_);
    if (index < 0 || index >= static_cast<int>(piece_signals_.size()))
    {
        return nullptr;
    }
    return piece_signals_[static_cast<std::size_t>(index)];
}

std::shared_ptr<CompletionSignal const>
TransferTracker::file_done(std::string const &path) const
{
    std::shared_lock<std::shared_mutex> lock(signals_mutex_);
    auto it = file_signals_.find(path);
    if (it == file_signals_.end())
    {
        return nullptr;
    }
    return it->second;
}

std::vector<FileInfo> TransferTracker::files() const
{
    std::shared_lock<std::shared_mutex> lock(signals_mutex_);
    if (!index_)
    {
        return {};
    }
    return index_->files();
}

int TransferTracker::piece_count() const
{
    std::shared_lock<std::shared_mutex> lock(signals_mutex_);
    return static_cast<int>(piece_signals_.size());
}

std::vector<int>
TransferTracker::pieces_for_file(std::string const &path) const
{
    std::shared_lock<std::shared_mutex> lock(signals_mutex_);
    if (!index_)
    {
        return {};
    }
    return index_->pieces_for_file(path);
}

bool TransferTracker::set_seed_ratio(double ratio)
{
    std::lock_guard<std::mutex> lock(seed_mutex_);
    if (seed_phase_started_)
    {
        return false;
    }
    seed_ratio_ = ratio;
    return true;
}

double TransferTracker::seed_ratio() const
{
    std::lock_guard<std::mutex> lock(seed_mutex_);
    return seed_ratio_;
}

std::optional<std::string> TransferTracker::error() const
{
    std::shared_lock<std::shared_mutex> lock(signals_mutex_);
    return error_;
}

void TransferTracker::run(std::shared_ptr<PieceFeed> feed)
{
    try
    {
        track(*feed);
    }
    catch (std::exception const &ex)
    {
        TL_LOG_ERROR("tracker for {} stopped: {}", transfer_->info_hash(),
                     ex.what());
        std::unique_lock<std::shared_mutex> lock(signals_mutex_);
        error_ = ex.what();
    }
    feed.reset();

    transfer_->closed().wait();
    closed_.close();
    TL_LOG_DEBUG("tracker for {} closed", transfer_->info_hash());
}

void TransferTracker::track(PieceFeed &feed)
{
    auto const &engine_closed = transfer_->closed();
    if (wait_any({&engine_closed, &transfer_->got_info()}) == 0)
    {
        return;
    }
    got_info_.close();

    if (!build_signals())
    {
        return;
    }

    if (transfer_->bytes_missing() == 0)
    {
        close_remaining();
        download_done_.close();
    }
    else
    {
        for (;;)
        {
            auto change = feed.receive();
            if (!change)
            {
                // The engine closes the feed when the transfer closes.
                return;
            }
            if (change->complete)
            {
                complete_piece(change->index);
            }
            if (transfer_->bytes_missing() == 0)
            {
                close_remaining();
                download_done_.close();
                break;
            }
        }
    }
    TL_LOG_DEBUG("{} finished downloading", transfer_->info_hash());

    seed();
}

bool TransferTracker::build_signals()
{
    auto const count = transfer_->num_pieces();
    std::vector<PieceInfo> pieces;
    pieces.reserve(static_cast<std::size_t>(std::max(count, 0)));
    for (int i = 0; i < count; ++i)
    {
        pieces.push_back(transfer_->piece(i));
    }

    std::unique_ptr<PieceIndex> index;
    try
    {
        index = std::make_unique<PieceIndex>(transfer_->files(),
                                             std::move(pieces));
    }
    catch (GeometryError const &ex)
    {
        TL_LOG_ERROR("{} has malformed geometry: {}", transfer_->info_hash(),
                     ex.what());
        std::unique_lock<std::shared_mutex> lock(signals_mutex_);
        error_ = ex.what();
        return false;
    }

    for (auto const &piece : index->pieces())
    {
        auto const &files = index->files_for_piece(piece.index);
        if (piece.length == 0 || transfer_->piece_complete(piece.index))
        {
            continue;
        }
        incomplete_piece_files_[piece.index].insert(files.begin(),
                                                    files.end());
        for (auto const &path : files)
        {
            incomplete_file_pieces_[path].insert(piece.index);
        }
    }

    {
        std::unique_lock<std::shared_mutex> lock(signals_mutex_);
        piece_signals_.reserve(index->pieces().size());
        for (std::size_t i = 0; i < index->pieces().size(); ++i)
        {
            piece_signals_.push_back(std::make_shared<CompletionSignal>());
        }
        for (auto const &file : index->files())
        {
            file_signals_.emplace(file.path,
                                  std::make_shared<CompletionSignal>());
        }
        index_ = std::move(index);
    }
    signals_ready_.close();

    for (std::size_t i = 0; i < piece_signals_.size(); ++i)
    {
        if (!incomplete_piece_files_.contains(static_cast<int>(i)))
        {
            piece_signals_[i]->close();
        }
    }
    for (auto const &file : index_->files())
    {
        if (!incomplete_file_pieces_.contains(file.path))
        {
            file_signals_.at(file.path)->close();
        }
    }
    return true;
}

void TransferTracker::complete_piece(int index)
{
    if (index < 0 || index >= static_cast<int>(piece_signals_.size()))
    {
        TL_LOG_WARN("{} reported unknown piece {}", transfer_->info_hash(),
                    index);
        return;
    }
    auto node = incomplete_piece_files_.extract(index);
    piece_signals_[static_cast<std::size_t>(index)]->close();
    if (node.empty())
    {
        return;
    }
    for (auto const &path : node.mapped())
    {
        auto it = incomplete_file_pieces_.find(path);
        if (it == incomplete_file_pieces_.end())
        {
            continue;
        }
        it->second.erase(index);
        if (it->second.empty())
        {
            incomplete_file_pieces_.erase(it);
            file_signals_.at(path)->close();
        }
    }
}

void TransferTracker::close_remaining()
{
    for (auto const &signal : piece_signals_)
    {
        signal->close();
    }
    for (auto const &file : index_->files())
    {
        file_signals_.at(file.path)->close();
    }
    incomplete_piece_files_.clear();
    incomplete_file_pieces_.clear();
}

void TransferTracker::seed()
{
    double ratio = 0.0;
    {
        std::lock_guard<std::mutex> lock(seed_mutex_);
        seed_phase_started_ = true;
        ratio = seed_ratio_;
    }

    if (ratio <= 0.0 || !transfer_->seeding())
    {
        seeding_done_.close();
        return;
    }

    auto const &engine_closed = transfer_->closed();
    for (;;)
    {
        auto const length = transfer_->length();
        auto wait = seed_wait(transfer_->stats().data_bytes_written, length,
                              ratio, options_.seed_poll_floor,
                              options_.seed_poll_span);
        if (length <= 0)
        {
            wait = options_.seed_poll_floor;
        }
        if (engine_closed.wait_for(wait))
        {
            return;
        }
        auto const completed = transfer_->bytes_completed();
        auto const written = transfer_->stats().data_bytes_written;
        // Nothing completed: any upload at all meets the ratio, none never
        // does.
        bool const reached =
            completed > 0 ? static_cast<double>(written) /
                                    static_cast<double>(completed) >=
                                ratio
                          : written > 0;
        if (reached)
        {
            seeding_done_.close();
            TL_LOG_DEBUG("{} reached seed ratio {}", transfer_->info_hash(),
                         ratio);
            return;
        }
    }
}

} // namespace tl::engine
