#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <exception>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace tl::log
{

inline constexpr std::uintmax_t kDefaultLogRotateBytes = 4 * 1024 * 1024;

// Defined in Log.cpp; appends one formatted line to the log file.
void append_log_line_to_file(std::string const &line);

// Redirects the log file. A file already larger than rotate_at, or one that
// grows past it, is renamed to <path>.1 and a fresh file is started.
void set_log_file(std::filesystem::path path,
                  std::uintmax_t rotate_at = kDefaultLogRotateBytes);
std::filesystem::path log_file_path();

// TL_ENABLE_LOGGING=1 forces logging on even in TL_BUILD_MINIMAL builds.
#if defined(TL_ENABLE_LOGGING) && (TL_ENABLE_LOGGING)
#define TL_LOGGING_ACTIVE 1
#elif !defined(TL_BUILD_MINIMAL)
#define TL_LOGGING_ACTIVE 1
#else
#define TL_LOGGING_ACTIVE 0
#endif

#if TL_LOGGING_ACTIVE
template <typename... Args>
inline void write_line(char level, std::string_view fmt, Args &&...args)
{
    auto const now = std::chrono::system_clock::now();
    auto const millis = static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch())
            .count() %
        1000);
    auto const time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    char time_buffer[16]{};
    std::strftime(time_buffer, sizeof(time_buffer), "%H:%M:%S", &tm);

    auto const message = std::vformat(fmt, std::make_format_args(args...));
    char millis_buf[8] = {};
    std::snprintf(millis_buf, sizeof(millis_buf), "%03lld", millis);
    std::string final;
    final.reserve(64 + message.size());
    final.push_back('[');
    final.push_back(level);
    final.push_back(' ');
    final.append(time_buffer);
    final.push_back('.');
    final.append(millis_buf);
    final.append("] ");
    final.append(message);
    if (stderr)
    {
        std::fprintf(stderr, "%s\n", final.c_str());
        std::fflush(stderr);
    }
    try
    {
        append_log_line_to_file(final);
    }
    catch (std::exception const &ex)
    {
        std::fprintf(stderr, "[E] log file append failed: %s\n", ex.what());
    }
}
#else
template <typename... Args>
inline void write_line(char, std::string_view, Args &&...) noexcept
{
}
#endif

template <typename... Args>
inline void print_status(std::string_view fmt, Args &&...args)
{
    auto const message = std::vformat(fmt, std::make_format_args(args...));
    std::fputs(message.c_str(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

} // namespace tl::log

#if TL_LOGGING_ACTIVE
#define TL_LOG_INFO(fmt, ...) tl::log::write_line('I', fmt, ##__VA_ARGS__)
#define TL_LOG_DEBUG(fmt, ...) tl::log::write_line('D', fmt, ##__VA_ARGS__)
#define TL_LOG_WARN(fmt, ...) tl::log::write_line('W', fmt, ##__VA_ARGS__)
#define TL_LOG_ERROR(fmt, ...) tl::log::write_line('E', fmt, ##__VA_ARGS__)
#else
#define TL_LOG_INFO(fmt, ...) (void)0
#define TL_LOG_DEBUG(fmt, ...) (void)0
#define TL_LOG_WARN(fmt, ...) (void)0
#define TL_LOG_ERROR(fmt, ...) (void)0
#endif
