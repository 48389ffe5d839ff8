#pragma once

#include <filesystem>
#include <optional>

namespace tl::utils
{

// Directory for the settings database and the log file. Honors
// TORRENTIAL_HOME, then XDG_STATE_HOME, then ~/.local/state.
std::optional<std::filesystem::path> state_root();

// Default download directory: <state_root>/downloads, else data/downloads
// beside the executable.
std::filesystem::path default_download_root();

std::optional<std::filesystem::path> executable_path();

} // namespace tl::utils
