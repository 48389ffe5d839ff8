#include "engine/ConfigurationService.hpp"
#include "utils/StateStore.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <doctest/doctest.h>

namespace
{

struct TempRoot
{
    explicit TempRoot(char const *name)
        : path(std::filesystem::temp_directory_path() / name)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        std::filesystem::create_directories(path, ec);
    }
    ~TempRoot()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path path;
};

} // namespace

TEST_CASE("ConfigurationService persists user settings")
{
    TempRoot root("torrential-config");
    auto db_path = root.path / "state.db";

    tl::engine::ServiceSettings defaults;
    defaults.download_path = root.path / "downloads";
    defaults.state_path = db_path;

    {
        auto database = std::make_shared<tl::storage::Database>(db_path);
        REQUIRE(database->is_valid());
        tl::engine::ConfigurationService config(database, defaults);
        auto initial = config.get();
        CHECK(initial.listen_interface == "0.0.0.0:6881");
        CHECK(initial.download_path == defaults.download_path);
        CHECK_FALSE(config.dirty());

        auto const new_path = root.path / "downloads2";
        config.set_listen_interface("127.0.0.1:9999");
        config.set_download_path(new_path);
        config.set_seed_ratio(1.5);
        config.set_drop_when_done(true);
        config.set_event_buffer_size(8);
        CHECK(config.dirty());

        config.persist_if_dirty();
        CHECK_FALSE(config.dirty());

        tl::storage::Database reader(db_path);
        REQUIRE(reader.is_valid());
        CHECK(reader.get_setting("listenInterface") == "127.0.0.1:9999");
        CHECK(reader.get_setting("downloadPath") == new_path.string());
        CHECK(reader.get_setting("dropWhenDone") == "1");
        CHECK(reader.get_setting("eventBufferSize") == "8");
    }

    auto database = std::make_shared<tl::storage::Database>(db_path);
    tl::engine::ConfigurationService restored(database, defaults);
    restored.load_persisted();
    auto settings = restored.get();
    CHECK(settings.listen_interface == "127.0.0.1:9999");
    CHECK(settings.download_path == root.path / "downloads2");
    CHECK(settings.seed_ratio == doctest::Approx(1.5));
    CHECK(settings.drop_when_done);
    CHECK(settings.event_buffer_size == 8);
    CHECK(settings.dht_enabled);
    CHECK_FALSE(restored.dirty());
}

TEST_CASE("listen interface is normalized")
{
    tl::engine::ConfigurationService config(nullptr, {});

    config.set_listen_interface("192.168.1.4");
    CHECK(config.get().listen_interface == "192.168.1.4:6881");

    config.set_listen_interface(":7000");
    CHECK(config.get().listen_interface == "0.0.0.0:7000");

    config.set_listen_interface("");
    CHECK(config.get().listen_interface == "0.0.0.0:7000");
}

TEST_CASE("change listener sees effective changes only")
{
    tl::engine::ConfigurationService config(nullptr, {});
    std::vector<double> ratios;
    config.set_change_listener([&ratios](tl::engine::ServiceSettings const &s)
                               { ratios.push_back(s.seed_ratio); });

    config.set_seed_ratio(2.0);
    config.set_seed_ratio(2.0);
    config.set_seed_ratio(0.5);
    REQUIRE(ratios.size() == 2);
    CHECK(ratios[0] == doctest::Approx(2.0));
    CHECK(ratios[1] == doctest::Approx(0.5));
}

TEST_CASE("settings without a database stay in memory")
{
    tl::engine::ConfigurationService config(nullptr, {});
    config.set_dht_enabled(false);
    CHECK(config.dirty());
    CHECK_FALSE(config.persist_now());
    CHECK(config.dirty());
    config.load_persisted();
    CHECK_FALSE(config.get().dht_enabled);
}

TEST_CASE("malformed persisted values fall back to defaults")
{
    TempRoot root("torrential-config-malformed");
    auto database =
        std::make_shared<tl::storage::Database>(root.path / "state.db");
    REQUIRE(database->is_valid());
    REQUIRE(database->set_setting("seedRatio", "lots"));
    REQUIRE(database->set_setting("eventBufferSize", "-3"));

    tl::engine::ServiceSettings defaults;
    defaults.seed_ratio = 0.25;
    tl::engine::ConfigurationService config(database, defaults);
    config.load_persisted();
    CHECK(config.get().seed_ratio == doctest::Approx(0.25));
    CHECK(config.get().event_buffer_size == 0);

    REQUIRE(database->remove_setting("seedRatio"));
    CHECK_FALSE(database->get_setting("seedRatio").has_value());
}
