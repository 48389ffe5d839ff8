#include "utils/Log.hpp"
#include "utils/FS.hpp"

#include <fstream>
#include <mutex>
#include <system_error>
#include <utility>

namespace tl::log
{

namespace
{

std::filesystem::path default_log_path()
{
    if (auto root = tl::utils::state_root())
    {
        return *root / "torrential.log";
    }
    return std::filesystem::path("torrential.log");
}

// Size-capped append-only file; keeps one rotated predecessor.
class LogFile
{
  public:
    void redirect(std::filesystem::path path, std::uintmax_t rotate_at)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stream_.close();
        path_ = std::move(path);
        rotate_at_ = rotate_at;
    }

    std::filesystem::path path()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (path_.empty())
        {
            path_ = default_log_path();
        }
        return path_;
    }

    void append(std::string const &line)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stream_.is_open() && !open())
        {
            return;
        }
        stream_ << line << '\n';
        stream_.flush();
        written_ += line.size() + 1;
        if (written_ >= rotate_at_)
        {
            stream_.close();
        }
    }

  private:
    bool open()
    {
        if (path_.empty())
        {
            path_ = default_log_path();
        }
        std::error_code ec;
        auto size = std::filesystem::file_size(path_, ec);
        if (ec)
        {
            size = 0;
        }
        if (size >= rotate_at_)
        {
            auto rotated = path_;
            rotated += ".1";
            std::filesystem::rename(path_, rotated, ec);
            size = ec ? size : 0;
        }
        stream_.open(path_, std::ios::app | std::ios::out);
        written_ = size;
        return stream_.is_open();
    }

    std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path path_;
    std::uintmax_t rotate_at_ = kDefaultLogRotateBytes;
    std::uintmax_t written_ = 0;
};

LogFile &log_file()
{
    static LogFile file;
    return file;
}

} // namespace

void append_log_line_to_file(std::string const &line)
{
    log_file().append(line);
}

void set_log_file(std::filesystem::path path, std::uintmax_t rotate_at)
{
    log_file().redirect(std::move(path), rotate_at);
}

std::filesystem::path log_file_path()
{
    return log_file().path();
}

} // namespace tl::log
