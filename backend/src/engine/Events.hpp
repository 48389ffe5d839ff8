#pragma once

#include "engine/Transfer.hpp"

#include <memory>
#include <optional>
#include <string_view>

namespace tl::engine
{

enum class EventType
{
    Added,
    GotInfo,
    PieceDone,
    FileDone,
    DownloadDone,
    SeedingDone,
    Closed,
};

// One lifecycle transition of a transfer as seen by a subscriber.
struct Event
{
    EventType type = EventType::Added;
    std::shared_ptr<Transfer> transfer;
    std::optional<FileInfo> file;
    std::optional<int> piece;
};

inline std::string_view to_string(EventType type) noexcept
{
    switch (type)
    {
    case EventType::Added:
        return "added";
    case EventType::GotInfo:
        return "gotInfo";
    case EventType::PieceDone:
        return "pieceDone";
    case EventType::FileDone:
        return "fileDone";
    case EventType::DownloadDone:
        return "downloadDone";
    case EventType::SeedingDone:
        return "seedingDone";
    case EventType::Closed:
        return "closed";
    }
    return "unknown";
}

inline std::optional<EventType> event_type_from_string(std::string_view name)
{
    for (auto type : {EventType::Added, EventType::GotInfo,
                      EventType::PieceDone, EventType::FileDone,
                      EventType::DownloadDone, EventType::SeedingDone,
                      EventType::Closed})
    {
        if (to_string(type) == name)
        {
            return type;
        }
    }
    return std::nullopt;
}

} // namespace tl::engine
