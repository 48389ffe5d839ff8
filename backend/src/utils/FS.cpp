#include "utils/FS.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <system_error>
#include <vector>

#if defined(__APPLE__)
#include <mach-o/dyld.h>
#else
#include <unistd.h>
#endif

namespace tl::utils
{

namespace
{
std::optional<std::filesystem::path> ensure_directory(
    std::filesystem::path const &candidate)
{
    std::error_code ec;
    std::filesystem::create_directories(candidate, ec);
    if (!ec || std::filesystem::exists(candidate))
    {
        return candidate;
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> env_path(char const *name)
{
    auto const *value = std::getenv(name);
    if (value == nullptr || *value == '\0')
    {
        return std::nullopt;
    }
    return std::filesystem::path(value);
}
} // namespace

std::optional<std::filesystem::path> executable_path()
{
#if defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    if (size == 0)
    {
        return std::nullopt;
    }
    std::vector<char> buffer(size);
    if (_NSGetExecutablePath(buffer.data(), &size) != 0)
    {
        return std::nullopt;
    }
    return std::filesystem::path(buffer.data());
#else
    std::vector<char> buffer(4096);
    while (true)
    {
        ssize_t length =
            readlink("/proc/self/exe", buffer.data(), buffer.size());
        if (length == -1)
        {
            return std::nullopt;
        }
        if (static_cast<std::size_t>(length) < buffer.size())
        {
            return std::filesystem::path(buffer.data(), buffer.data() + length);
        }
        buffer.resize(buffer.size() * 2);
    }
#endif
}

std::optional<std::filesystem::path> state_root()
{
    if (auto home = env_path("TORRENTIAL_HOME"))
    {
        return ensure_directory(*home);
    }
    if (auto xdg = env_path("XDG_STATE_HOME"))
    {
        return ensure_directory(*xdg / "torrential");
    }
    if (auto home = env_path("HOME"))
    {
        return ensure_directory(*home / ".local" / "state" / "torrential");
    }
    return std::nullopt;
}

std::filesystem::path default_download_root()
{
    if (auto root = state_root())
    {
        return *root / "downloads";
    }
    if (auto exe = executable_path(); exe && !exe->filename().empty())
    {
        return exe->parent_path() / "data" / "downloads";
    }
    return std::filesystem::current_path() / "data" / "downloads";
}

} // namespace tl::utils
