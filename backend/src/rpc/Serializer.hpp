#pragma once

#include "engine/Events.hpp"
#include "engine/TransferSnapshot.hpp"

#include <string>
#include <string_view>

namespace tl::rpc
{

// {"event":{"type":...,"torrent":{...},"file":{...},"piece":N}}; file and
// piece are present only when the event carries them.
std::string serialize_event(engine::Event const &event);
std::string serialize_transfer(engine::TransferSnapshot const &snapshot);
std::string serialize_error(std::string_view message);

} // namespace tl::rpc
