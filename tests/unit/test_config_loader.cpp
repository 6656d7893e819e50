#include <gtest/gtest.h>
#include "tracker/config_loader/config_loader.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using FtseTracker::Config::SystemConfig;

namespace {

class ConfigLoaderTest : public ::testing::Test {
protected:
    std::filesystem::path config_directory;

    void SetUp() override {
        unsetenv("PORT");
        std::string unique_name = "ftse_tracker_config_" +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        config_directory = std::filesystem::temp_directory_path() / unique_name;
        std::filesystem::create_directories(config_directory);
        for (const char* file_name : {"source_config.csv", "market_config.csv", "timing_config.csv",
                                      "logging_config.csv", "server_config.csv"}) {
            write_file(file_name, "# defaults\n");
        }
    }

    void TearDown() override {
        unsetenv("PORT");
        std::error_code remove_error;
        std::filesystem::remove_all(config_directory, remove_error);
    }

    void write_file(const std::string& file_name, const std::string& contents) {
        std::ofstream config_file(config_directory / file_name, std::ios::trunc);
        config_file << contents;
    }

    std::string path_of(const std::string& file_name) const {
        return (config_directory / file_name).string();
    }
};

} // anonymous namespace

TEST_F(ConfigLoaderTest, ShippedConfigurationLoadsAndValidates) {
    SystemConfig config;
    ASSERT_EQ(load_system_config(config, FTSE_TRACKER_CONFIG_DIR), 0);

    EXPECT_EQ(config.source.url, "https://histock.tw/index-tw/TWN");
    EXPECT_NE(config.source.user_agent.find("like Gecko"), std::string::npos);
    EXPECT_EQ(config.source.markup.down_glyph, "\xE2\x96\xBC");
    EXPECT_EQ(config.market.session.time_zone_name, "Asia/Taipei");
    EXPECT_EQ(config.market.session.open_seconds_of_day, 8 * 3600 + 45 * 60);
    EXPECT_EQ(config.market.session.close_seconds_of_day, 13 * 3600 + 45 * 60);
    EXPECT_DOUBLE_EQ(config.market.derived.coefficient, 12.28065515714918);
    EXPECT_DOUBLE_EQ(config.market.fallback.price, 1637.5);
    EXPECT_EQ(config.market.fallback.validity_window_seconds, 300);
    EXPECT_EQ(config.timing.market_open_staleness_threshold_sec, 20);
    EXPECT_EQ(config.timing.updater_market_closed_interval_sec, 60);
    EXPECT_EQ(config.server.port, 5001);
    EXPECT_EQ(config.server.session_timeout_seconds, 10);
    EXPECT_EQ(config.server.max_concurrent_sessions, 16);
}

TEST_F(ConfigLoaderTest, EmptyFilesKeepDefaults) {
    SystemConfig config;
    ASSERT_EQ(load_system_config(config, config_directory.string()), 0);
    EXPECT_EQ(config.server.port, 5001);
    EXPECT_EQ(config.source.index_code, "TWN");
}

TEST_F(ConfigLoaderTest, ReadsValuesAndSkipsCommentsAndBlankLines) {
    write_file("timing_config.csv",
               "# comment\n"
               "\n"
               "  timing.market_open_staleness_threshold_sec , 15 \n"
               "timing.updater_market_open_interval_sec,7\n");
    write_file("market_config.csv",
               "session.open_time,09:00:00\n"
               "session.close_time,13:30:00\n"
               "fallback.label,default\n");

    SystemConfig config;
    ASSERT_EQ(load_system_config(config, config_directory.string()), 0);
    EXPECT_EQ(config.timing.market_open_staleness_threshold_sec, 15);
    EXPECT_EQ(config.timing.updater_market_open_interval_sec, 7);
    EXPECT_EQ(config.market.session.open_seconds_of_day, 9 * 3600);
    EXPECT_EQ(config.market.session.close_seconds_of_day, 13 * 3600 + 30 * 60);
    EXPECT_EQ(config.market.fallback.label, "default");
}

TEST_F(ConfigLoaderTest, UnknownKeyIsIgnored) {
    write_file("server_config.csv", "server.colour,blue\nserver.port,6000\n");

    SystemConfig config;
    EXPECT_TRUE(load_config_from_csv(config, path_of("server_config.csv")));
    EXPECT_EQ(config.server.port, 6000);
}

TEST_F(ConfigLoaderTest, RejectsValuesThatDoNotParse) {
    SystemConfig config;

    write_file("server_config.csv", "server.port,50o1\n");
    EXPECT_FALSE(load_config_from_csv(config, path_of("server_config.csv")));

    write_file("source_config.csv", "source.enable_ssl_verification,maybe\n");
    EXPECT_FALSE(load_config_from_csv(config, path_of("source_config.csv")));

    write_file("market_config.csv", "session.open_time,25:00:00\n");
    EXPECT_FALSE(load_config_from_csv(config, path_of("market_config.csv")));

    write_file("market_config.csv", "derived.coefficient,twelve\n");
    EXPECT_FALSE(load_config_from_csv(config, path_of("market_config.csv")));
}

TEST_F(ConfigLoaderTest, RejectsMalformedLine) {
    write_file("timing_config.csv", "timing.updater_error_backoff_sec\n");

    SystemConfig config;
    EXPECT_FALSE(load_config_from_csv(config, path_of("timing_config.csv")));
}

TEST_F(ConfigLoaderTest, MissingFileFailsTheLoad) {
    std::filesystem::remove(config_directory / "logging_config.csv");

    SystemConfig config;
    EXPECT_EQ(load_system_config(config, config_directory.string()), 1);
}

TEST_F(ConfigLoaderTest, PortEnvironmentVariableOverridesFile) {
    write_file("server_config.csv", "server.port,6000\n");
    setenv("PORT", "8080", 1);

    SystemConfig config;
    ASSERT_EQ(load_system_config(config, config_directory.string()), 0);
    EXPECT_EQ(config.server.port, 8080);
}

TEST_F(ConfigLoaderTest, InvalidPortEnvironmentVariableFailsTheLoad) {
    setenv("PORT", "eighty", 1);

    SystemConfig config;
    std::string error_message;
    EXPECT_FALSE(apply_environment_overrides(config, error_message));
    EXPECT_NE(error_message.find("PORT"), std::string::npos);
    EXPECT_EQ(load_system_config(config, config_directory.string()), 1);
}

TEST_F(ConfigLoaderTest, ValidationRejectsInconsistentSettings) {
    std::string error_message;

    SystemConfig unknown_zone;
    unknown_zone.market.session.time_zone_name = "Europe/Atlantis";
    EXPECT_FALSE(validate_config(unknown_zone, error_message));
    EXPECT_NE(error_message.find("session.timezone"), std::string::npos);

    SystemConfig inverted_session;
    inverted_session.market.session.open_seconds_of_day = 14 * 3600;
    EXPECT_FALSE(validate_config(inverted_session, error_message));

    SystemConfig bad_port;
    bad_port.server.port = 70000;
    EXPECT_FALSE(validate_config(bad_port, error_message));

    SystemConfig bad_thresholds;
    bad_thresholds.timing.connectivity_degraded_threshold = 3;
    bad_thresholds.timing.connectivity_disconnected_threshold = 3;
    EXPECT_FALSE(validate_config(bad_thresholds, error_message));

    SystemConfig same_direction_classes;
    same_direction_classes.source.markup.down_class = same_direction_classes.source.markup.up_class;
    EXPECT_FALSE(validate_config(same_direction_classes, error_message));

    SystemConfig no_window;
    no_window.market.fallback.validity_window_seconds = 0;
    EXPECT_FALSE(validate_config(no_window, error_message));

    SystemConfig no_session_deadline;
    no_session_deadline.server.session_timeout_seconds = 0;
    EXPECT_FALSE(validate_config(no_session_deadline, error_message));
    EXPECT_NE(error_message.find("server.session_timeout_seconds"), std::string::npos);

    SystemConfig no_sessions;
    no_sessions.server.max_concurrent_sessions = 0;
    EXPECT_FALSE(validate_config(no_sessions, error_message));

    SystemConfig defaults;
    EXPECT_TRUE(validate_config(defaults, error_message));
}
