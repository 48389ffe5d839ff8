#pragma once

#include "engine/CompletionSignal.hpp"
#include "engine/PieceIndex.hpp"
#include "engine/Transfer.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tl::engine
{

struct TrackerOptions
{
    // Uploaded/downloaded ratio after which seeding counts as done; <= 0
    // finishes seeding as soon as the download does.
    double seed_ratio = 0.0;
    std::chrono::milliseconds seed_poll_floor{1000};
    std::chrono::milliseconds seed_poll_span{15000};
};

// Delay before the next seed ratio check. Shrinks linearly from floor + span
// towards floor as the uploaded share of the target grows, and is zero once
// the target is exceeded.
std::chrono::milliseconds seed_wait(std::int64_t data_bytes_written,
                                    std::int64_t length, double seed_ratio,
                                    std::chrono::milliseconds floor,
                                    std::chrono::milliseconds span);

// Follows one transfer through metadata, per piece and per file completion,
// download completion, the seeding target and closure. Every transition is a
// CompletionSignal that closes exactly once.
class TransferTracker : public std::enable_shared_from_this<TransferTracker>
{
  public:
    // Subscribes to the transfer's piece feed before returning, so no
    // completion published after create() is missed.
    static std::shared_ptr<TransferTracker>
    create(std::shared_ptr<Transfer> transfer, TrackerOptions options = {});

    TransferTracker(TransferTracker const &) = delete;
    TransferTracker &operator=(TransferTracker const &) = delete;

    CompletionSignal const &added() const noexcept { return added_; }
    CompletionSignal const &got_info() const noexcept { return got_info_; }
    CompletionSignal const &signals_ready() const noexcept
    {
        return signals_ready_;
    }
    CompletionSignal const &download_done() const noexcept
    {
        return download_done_;
    }
    CompletionSignal const &seeding_done() const noexcept
    {
        return seeding_done_;
    }
    CompletionSignal const &closed() const noexcept { return closed_; }

    // Null until signals_ready() closes, or when the key is unknown.
    std::shared_ptr<CompletionSignal const> piece_done(int index) const;
    std::shared_ptr<CompletionSignal const>
    file_done(std::string const &path) const;

    std::vector<FileInfo> files() const;
    int piece_count() const;
    std::vector<int> pieces_for_file(std::string const &path) const;

    std::shared_ptr<Transfer> const &transfer() const noexcept
    {
        return transfer_;
    }

    // Returns false once the seed phase has captured its ratio.
    bool set_seed_ratio(double ratio);
    double seed_ratio() const;

    std::optional<std::string> error() const;

  private:
    TransferTracker(std::shared_ptr<Transfer> transfer, TrackerOptions options);

    void run(std::shared_ptr<PieceFeed> feed);
    // Returns once nothing but transfer closure is left to observe.
    void track(PieceFeed &feed);
    bool build_signals();
    void complete_piece(int index);
    void close_remaining();
    void seed();

    std::shared_ptr<Transfer> transfer_;
    TrackerOptions options_;

    CompletionSignal added_;
    CompletionSignal got_info_;
    CompletionSignal signals_ready_;
    CompletionSignal download_done_;
    CompletionSignal seeding_done_;
    CompletionSignal closed_;

    mutable std::shared_mutex signals_mutex_;
    std::unique_ptr<PieceIndex> index_;
    std::vector<SignalPtr> piece_signals_;
    std::unordered_map<std::string, SignalPtr> file_signals_;
    std::optional<std::string> error_;

    mutable std::mutex seed_mutex_;
    double seed_ratio_ = 0.0;
    bool seed_phase_started_ = false;

    // Worker-owned; shrink as completions are confirmed.
    std::unordered_map<int, std::unordered_set<std::string>>
        incomplete_piece_files_;
    std::unordered_map<std::string, std::unordered_set<int>>
        incomplete_file_pieces_;
};

} // namespace tl::engine
