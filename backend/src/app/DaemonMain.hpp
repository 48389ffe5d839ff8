#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tl::app
{

struct DaemonOptions
{
    std::optional<std::filesystem::path> download_dir;
    std::optional<std::filesystem::path> state_path;
    std::optional<std::string> listen_interface;
    std::optional<double> seed_ratio;
    bool drop_when_done = false;
    std::optional<std::size_t> event_buffer;
    std::vector<std::string> sources;
    bool show_help = false;
    bool show_version = false;
};

DaemonOptions parse_arguments(int argc, char const *const argv[]);

// Runs the Torrential daemon: session, trackers and the event printer.
// Returns the process exit code.
int daemon_main(int argc, char *argv[]);

} // namespace tl::app
