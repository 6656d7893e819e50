#include <gtest/gtest.h>
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

using namespace FtseTracker::Logging;

namespace {

class AsyncLoggerTest : public ::testing::Test {
protected:
    std::filesystem::path log_path = std::filesystem::temp_directory_path() / "ftse_tracker_async_logger_test.log";

    void TearDown() override {
        clear_logging_context();
        std::error_code remove_error;
        std::filesystem::remove(log_path, remove_error);
    }

    std::string read_log() const {
        std::ifstream log_file(log_path);
        std::stringstream contents;
        contents << log_file.rdbuf();
        return contents.str();
    }
};

} // anonymous namespace

TEST_F(AsyncLoggerTest, DrainWritesQueuedLinesInOrder) {
    AsyncLogger logger(log_path.string());
    logger.start();
    logger.enqueue("first\n");
    logger.enqueue("second\n");

    {
        std::ofstream log_file(log_path);
        EXPECT_EQ(logger.wait_and_drain(log_file, std::chrono::milliseconds(100)), 2u);
    }
    EXPECT_EQ(read_log(), "first\nsecond\n");
}

TEST_F(AsyncLoggerTest, LinesQueuedAroundStopAreStillWritten) {
    AsyncLogger logger(log_path.string());
    logger.start();
    logger.enqueue("before stop\n");
    logger.stop();
    EXPECT_FALSE(logger.is_running());
    logger.enqueue("after stop\n");

    {
        std::ofstream log_file(log_path);
        EXPECT_EQ(logger.drain_remaining(log_file), 2u);
        EXPECT_EQ(logger.drain_remaining(log_file), 0u);
    }
    EXPECT_EQ(read_log(), "before stop\nafter stop\n");
}

TEST_F(AsyncLoggerTest, LogMessageQueuesWithThreadTag) {
    LoggingContext context;
    context.async_logger = std::make_shared<AsyncLogger>(log_path.string());
    context.async_logger->start();
    set_logging_context(context);
    set_log_thread_tag("UPDATER");

    log_message("refresh done", "");

    {
        std::ofstream log_file(log_path);
        EXPECT_EQ(context.async_logger->drain_remaining(log_file), 1u);
    }
    std::string line = read_log();
    // Tags are cut to six characters
    EXPECT_NE(line.find("[UPDATE]   refresh done\n"), std::string::npos);
}

TEST(LoggingTableTest, CellsAreClippedAndPadded) {
    EXPECT_EQ(fit_table_cell("abc", 5), "abc  ");
    EXPECT_EQ(fit_table_cell("abcdefgh", 3), "abc");

    std::string row = make_table_row("Price", "1637.00");
    EXPECT_EQ(row, "│ " + fit_table_cell("Price", TABLE_LABEL_WIDTH) + " │ " +
                   fit_table_cell("1637.00", TABLE_VALUE_WIDTH) + " │");
    EXPECT_EQ(make_table_row(std::string(30, 'x'), "v").find(std::string(18, 'x')), std::string::npos);
}
