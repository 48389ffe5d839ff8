#include "app/DaemonMain.hpp"

#include "engine/CompletionSignal.hpp"
#include "engine/ConfigurationService.hpp"
#include "engine/Service.hpp"
#include "engine/TorrentUtils.hpp"
#include "rpc/Serializer.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"
#include "utils/StateStore.hpp"
#include "utils/Version.hpp"

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace
{

void print_usage()
{
    std::fprintf(
        stderr,
        "usage: torrentiald [--download-dir DIR] [--state FILE] "
        "[--listen IFACE]\n"
        "                   [--seed-ratio R] [--drop-when-done] "
        "[--event-buffer N] [SOURCE...]\n"
        "SOURCE is a magnet URI or a path to a .torrent file.\n");
}

void add_source(tl::engine::Service &service, std::string const &source)
{
    using Status = tl::engine::Service::AddStatus;
    auto status = tl::engine::is_magnet_uri(source)
                      ? service.add_magnet(source)
                      : service.add_torrent_file(source);
    switch (status)
    {
    case Status::Ok:
        return;
    case Status::InvalidUri:
        tl::log::print_status("{}", tl::rpc::serialize_error(
                                        "invalid magnet URI: " + source));
        return;
    case Status::InvalidTorrentFile:
        tl::log::print_status("{}", tl::rpc::serialize_error(
                                        "invalid torrent file: " + source));
        return;
    case Status::AlreadyExists:
        TL_LOG_INFO("{} is already being tracked", source);
        return;
    case Status::EngineUnavailable:
        tl::log::print_status(
            "{}", tl::rpc::serialize_error("engine unavailable"));
        return;
    }
}

} // namespace

namespace tl::app
{

// Accepts "--flag value" and "--flag=value". Throws std::invalid_argument on
// malformed input.
DaemonOptions parse_arguments(int argc, char const *const argv[])
{
    DaemonOptions options;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "-h")
        {
            options.show_help = true;
            continue;
        }
        if (arg.size() > 1 && arg.front() == '-' && arg.rfind("--", 0) != 0)
        {
            throw std::invalid_argument("unknown option " + std::string(arg));
        }
        if (arg.rfind("--", 0) != 0)
        {
            options.sources.emplace_back(arg);
            continue;
        }

        std::string name(arg);
        std::optional<std::string> inline_value;
        if (auto eq = name.find('='); eq != std::string::npos)
        {
            inline_value = name.substr(eq + 1);
            name.resize(eq);
        }
        auto value = [&]() -> std::string
        {
            if (inline_value)
            {
                return *inline_value;
            }
            if (i + 1 >= argc)
            {
                throw std::invalid_argument(name + " requires a value");
            }
            return argv[++i];
        };

        if (name == "--help")
        {
            options.show_help = true;
        }
        else if (name == "--version")
        {
            options.show_version = true;
        }
        else if (name == "--download-dir")
        {
            options.download_dir = value();
        }
        else if (name == "--state")
        {
            options.state_path = value();
        }
        else if (name == "--listen")
        {
            options.listen_interface = value();
        }
        else if (name == "--seed-ratio")
        {
            options.seed_ratio = std::stod(value());
        }
        else if (name == "--drop-when-done")
        {
            options.drop_when_done = true;
        }
        else if (name == "--event-buffer")
        {
            auto parsed = std::stoi(value());
            if (parsed < 0)
            {
                throw std::invalid_argument("--event-buffer must be >= 0");
            }
            options.event_buffer = static_cast<std::size_t>(parsed);
        }
        else
        {
            throw std::invalid_argument("unknown option " + name);
        }
    }
    return options;
}

int daemon_main(int argc, char *argv[])
{
    try
    {
        tl::runtime::install_signal_handlers();

        DaemonOptions options;
        try
        {
            options = parse_arguments(argc, argv);
        }
        catch (std::logic_error const &ex)
        {
            std::fprintf(stderr, "torrentiald: %s\n", ex.what());
            print_usage();
            return 2;
        }
        if (options.show_help)
        {
            print_usage();
            return 0;
        }
        if (options.show_version)
        {
            tl::log::print_status("{}", tl::version::kDisplayVersion);
            return 0;
        }

        auto root = tl::utils::state_root().value_or(
            std::filesystem::current_path() / "data");
        std::error_code ec;
        std::filesystem::create_directories(root, ec);
        if (ec)
        {
            TL_LOG_WARN("failed to create state directory {}: {}",
                        root.string(), ec.message());
        }
        auto state_path = options.state_path.value_or(root / "torrential.db");
        if (options.state_path)
        {
            tl::log::set_log_file(state_path.parent_path() / "torrential.log");
        }

        auto database = std::make_shared<tl::storage::Database>(state_path);
        if (!database->is_valid())
        {
            TL_LOG_WARN("settings database {} unavailable; settings will not "
                        "persist",
                        state_path.string());
            database.reset();
        }

        tl::engine::ServiceSettings defaults;
        defaults.download_path = tl::utils::default_download_root();
        defaults.state_path = state_path;
        auto config = std::make_shared<tl::engine::ConfigurationService>(
            database, defaults);
        config->load_persisted();
        if (options.download_dir)
        {
            config->set_download_path(*options.download_dir);
        }
        if (options.listen_interface)
        {
            config->set_listen_interface(*options.listen_interface);
        }
        if (options.seed_ratio)
        {
            config->set_seed_ratio(*options.seed_ratio);
        }
        if (options.drop_when_done)
        {
            config->set_drop_when_done(true);
        }
        if (options.event_buffer)
        {
            config->set_event_buffer_size(*options.event_buffer);
        }

        auto service = tl::engine::Service::create(config);
        TL_LOG_INFO("{} starting; downloads go to {}",
                    tl::version::kDisplayVersion,
                    config->get().download_path.string());

        auto cancel = tl::engine::make_cancel_token();
        auto events = service->events(cancel);
        std::thread printer(
            [events]
            {
                while (auto event = events->receive())
                {
                    tl::log::print_status("{}",
                                          tl::rpc::serialize_event(*event));
                }
            });
        std::thread engine_thread([svc = service.get()] { svc->run(); });
        TL_LOG_INFO("Engine thread started");

        for (auto const &source : options.sources)
        {
            add_source(*service, source);
        }

        while (!tl::runtime::should_shutdown())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        TL_LOG_INFO("Shutdown requested; stopping engine...");
        // 1. Stop the event printer
        cancel->close();
        // 2. Stop pumping alerts
        service->stop();
        if (engine_thread.joinable())
        {
            engine_thread.join();
        }
        // 3. Close every transfer while the session is still alive
        service->shutdown();
        if (printer.joinable())
        {
            printer.join();
        }
        config->persist_if_dirty();
        service.reset();

        TL_LOG_INFO("Shutdown complete.");
        return 0;
    }
    catch (std::exception const &ex)
    {
        std::fprintf(stderr, "Torrential daemon failed: %s\n", ex.what());
    }
    return 1;
}

} // namespace tl::app
