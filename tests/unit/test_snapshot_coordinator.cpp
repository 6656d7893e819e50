#include <gtest/gtest.h>
#include "tracker/coordinators/snapshot_coordinator.hpp"
#include "threads/refresh_task_pool.hpp"
#include "fixtures/fake_page_source.hpp"
#include "fixtures/manual_time_provider.hpp"
#include "fixtures/quote_pages.hpp"
#include <atomic>
#include <chrono>
#include <cmath>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace FtseTracker::Core;
using FtseTracker::Config::SystemConfig;
using FtseTracker::Threads::RefreshTaskPool;
using std::chrono::seconds;

namespace {

class SnapshotCoordinatorTest : public ::testing::Test {
protected:
    SystemConfig config;
    SnapshotStore store;
    FakePageSource page_source;
    ManualTimeProvider clock{QuotePages::taipei_wednesday(10, 0, 0)};
    SnapshotCoordinator coordinator{config, store, page_source, clock};

    void SetUp() override {
        page_source.serve_page(QuotePages::falling_quote_page());
    }

    Snapshot current_snapshot() const {
        std::optional<Snapshot> snapshot = store.read_snapshot();
        if (!snapshot) {
            throw std::runtime_error("store is empty");
        }
        return *snapshot;
    }
};

} // anonymous namespace

TEST_F(SnapshotCoordinatorTest, SuccessfulRefreshPublishesQuantizedSnapshot) {
    EXPECT_EQ(coordinator.refresh(), RefreshOutcome::SUCCESS);

    Snapshot snapshot = current_snapshot();
    EXPECT_EQ(snapshot.code, "TWN");
    EXPECT_EQ(snapshot.name, "富時台指");
    EXPECT_DOUBLE_EQ(snapshot.price, 1637.0);
    EXPECT_DOUBLE_EQ(snapshot.change, -68.3);
    EXPECT_DOUBLE_EQ(snapshot.change_percent, -4.0);
    EXPECT_DOUBLE_EQ(snapshot.derived_price, 20103.0);
    EXPECT_DOUBLE_EQ(snapshot.derived_offset, -7453.0);
    EXPECT_EQ(snapshot.source, SnapshotSource::LIVE_FETCH);
    EXPECT_EQ(snapshot.source_label, "HiStock網站");
    EXPECT_TRUE(snapshot.market_open);
    EXPECT_EQ(snapshot.captured_at, clock.now());
    EXPECT_EQ(snapshot.captured_at_local, "2024-03-06 10:00:00");
    EXPECT_FALSE(snapshot.error.has_value());
}

TEST_F(SnapshotCoordinatorTest, FailureInsideWindowReusesLastSnapshot) {
    ASSERT_EQ(coordinator.refresh(), RefreshOutcome::SUCCESS);
    auto captured_at = clock.now();

    clock.advance(seconds(200));
    page_source.fail_with_network_error("Connection timed out");
    EXPECT_EQ(coordinator.refresh(), RefreshOutcome::REUSED_LAST_SNAPSHOT);

    Snapshot snapshot = current_snapshot();
    EXPECT_DOUBLE_EQ(snapshot.price, 1637.0);
    EXPECT_EQ(snapshot.source, SnapshotSource::LIVE_FETCH);
    EXPECT_EQ(snapshot.captured_at, captured_at);
    EXPECT_EQ(snapshot.error.value(), "Network error: Connection timed out");
}

TEST_F(SnapshotCoordinatorTest, FailureAfterWindowInstallsDefaultSnapshot) {
    ASSERT_EQ(coordinator.refresh(), RefreshOutcome::SUCCESS);

    clock.advance(seconds(400));
    page_source.fail_with_network_error("Connection timed out");
    EXPECT_EQ(coordinator.refresh(), RefreshOutcome::DEFAULT_FALLBACK);

    Snapshot snapshot = current_snapshot();
    EXPECT_EQ(snapshot.source, SnapshotSource::DEFAULT_FALLBACK);
    EXPECT_EQ(snapshot.source_label, "預設數據");
    EXPECT_DOUBLE_EQ(snapshot.price, 1637.5);
    EXPECT_DOUBLE_EQ(snapshot.change, -68.3);
    EXPECT_DOUBLE_EQ(snapshot.change_percent, -4.0);
    EXPECT_DOUBLE_EQ(snapshot.derived_price, 20110.0);
    EXPECT_DOUBLE_EQ(snapshot.derived_offset, -7446.0);
    EXPECT_EQ(snapshot.captured_at, clock.now());
    EXPECT_EQ(snapshot.error.value(), "Network error: Connection timed out");
}

TEST_F(SnapshotCoordinatorTest, WindowBoundaryUsesDefaultSnapshot) {
    ASSERT_EQ(coordinator.refresh(), RefreshOutcome::SUCCESS);

    clock.advance(seconds(300));
    page_source.fail_with_network_error("refused");
    EXPECT_EQ(coordinator.refresh(), RefreshOutcome::DEFAULT_FALLBACK);
}

TEST_F(SnapshotCoordinatorTest, ReuseDoesNotExtendTheWindow) {
    ASSERT_EQ(coordinator.refresh(), RefreshOutcome::SUCCESS);
    page_source.fail_with_network_error("refused");

    clock.advance(seconds(200));
    EXPECT_EQ(coordinator.refresh(), RefreshOutcome::REUSED_LAST_SNAPSHOT);
    clock.advance(seconds(101));
    EXPECT_EQ(coordinator.refresh(), RefreshOutcome::DEFAULT_FALLBACK);
}

TEST_F(SnapshotCoordinatorTest, FirstFetchFailureStillLeavesASnapshot) {
    page_source.fail_with_network_error("Could not resolve host");
    EXPECT_EQ(coordinator.refresh(), RefreshOutcome::DEFAULT_FALLBACK);

    Snapshot snapshot = current_snapshot();
    EXPECT_EQ(snapshot.source, SnapshotSource::DEFAULT_FALLBACK);
    EXPECT_EQ(snapshot.error.value(), "Network error: Could not resolve host");
}

TEST_F(SnapshotCoordinatorTest, ErrorMessagesCarryTheirCategoryPrefix) {
    page_source.serve_page(QuotePages::page_without_price_region());
    coordinator.refresh();
    EXPECT_EQ(current_snapshot().error.value(), "Price info region not found");

    page_source.serve_page(QuotePages::make_quote_page("N/A", "clr-rd", "1.00", "clr-rd", "0.10%", "clr-rd"));
    coordinator.refresh();
    EXPECT_EQ(current_snapshot().error.value(), "Data format error: Price value is not numeric: 'N/A'");

    page_source.fail_with_unexpected_error("boom");
    coordinator.refresh();
    EXPECT_EQ(current_snapshot().error.value(), "System error: boom");
}

TEST_F(SnapshotCoordinatorTest, SuccessClearsPreviousError) {
    page_source.fail_with_network_error("refused");
    coordinator.refresh();
    ASSERT_TRUE(current_snapshot().error.has_value());

    page_source.serve_page(QuotePages::rising_quote_page());
    EXPECT_EQ(coordinator.refresh(), RefreshOutcome::SUCCESS);
    Snapshot snapshot = current_snapshot();
    EXPECT_FALSE(snapshot.error.has_value());
    EXPECT_DOUBLE_EQ(snapshot.price, 1706.0);
    EXPECT_DOUBLE_EQ(snapshot.derived_price, 20951.0);
}

TEST_F(SnapshotCoordinatorTest, EmptyStoreReadBlocksOnRefresh) {
    Snapshot snapshot = coordinator.get_current();

    EXPECT_EQ(page_source.get_fetch_count(), 1);
    EXPECT_DOUBLE_EQ(snapshot.price, 1637.0);
}

TEST_F(SnapshotCoordinatorTest, FreshReadDoesNotRequestRefresh) {
    RefreshTaskPool pool(1, 4);   // never started: every submission is counted as dropped
    coordinator.set_refresh_task_pool(&pool);
    ASSERT_EQ(coordinator.refresh(), RefreshOutcome::SUCCESS);

    clock.advance(seconds(20));
    coordinator.get_current();
    EXPECT_EQ(pool.get_dropped_count(), 0u);
    EXPECT_EQ(page_source.get_fetch_count(), 1);
}

TEST_F(SnapshotCoordinatorTest, StaleReadReturnsImmediatelyAndRequestsRefresh) {
    RefreshTaskPool pool(1, 4);
    coordinator.set_refresh_task_pool(&pool);
    ASSERT_EQ(coordinator.refresh(), RefreshOutcome::SUCCESS);

    clock.advance(seconds(21));
    page_source.serve_page(QuotePages::rising_quote_page());
    Snapshot snapshot = coordinator.get_current();

    EXPECT_DOUBLE_EQ(snapshot.price, 1637.0);
    EXPECT_EQ(pool.get_dropped_count(), 1u);
    EXPECT_EQ(page_source.get_fetch_count(), 1);
}

TEST_F(SnapshotCoordinatorTest, StaleReadRefreshRunsOnThePool) {
    RefreshTaskPool pool(1, 4);
    pool.start();
    coordinator.set_refresh_task_pool(&pool);
    ASSERT_EQ(coordinator.refresh(), RefreshOutcome::SUCCESS);

    clock.advance(seconds(21));
    page_source.serve_page(QuotePages::rising_quote_page());
    coordinator.get_current();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (pool.get_completed_count() < 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    pool.stop();

    EXPECT_EQ(pool.get_completed_count(), 1u);
    EXPECT_DOUBLE_EQ(current_snapshot().price, 1706.0);
}

TEST_F(SnapshotCoordinatorTest, ReadWithoutPoolStillServesSnapshot) {
    ASSERT_EQ(coordinator.refresh(), RefreshOutcome::SUCCESS);
    clock.advance(seconds(60));

    EXPECT_FALSE(coordinator.request_async_refresh());
    EXPECT_DOUBLE_EQ(coordinator.get_current().price, 1637.0);
}

TEST_F(SnapshotCoordinatorTest, ForcedRequestRefreshesInline) {
    ASSERT_EQ(coordinator.refresh(), RefreshOutcome::SUCCESS);
    page_source.serve_page(QuotePages::rising_quote_page());

    Snapshot snapshot = coordinator.get_current_for_request(true);
    EXPECT_EQ(page_source.get_fetch_count(), 2);
    EXPECT_DOUBLE_EQ(snapshot.price, 1706.0);
}

TEST_F(SnapshotCoordinatorTest, UnforcedRequestWithFreshCaptureDoesNotFetch) {
    ASSERT_EQ(coordinator.refresh(), RefreshOutcome::SUCCESS);
    clock.advance(seconds(5));

    coordinator.get_current_for_request(false);
    EXPECT_EQ(page_source.get_fetch_count(), 1);
}

TEST_F(SnapshotCoordinatorTest, ExpiredCaptureRefreshesInlineEvenWhenRecentlyAnnotated) {
    ASSERT_EQ(coordinator.refresh(), RefreshOutcome::SUCCESS);
    page_source.fail_with_network_error("refused");
    clock.advance(seconds(15));
    ASSERT_EQ(coordinator.refresh(), RefreshOutcome::REUSED_LAST_SNAPSHOT);

    // Schedule clock is 10s old, capture is 25s old
    clock.advance(seconds(10));
    page_source.serve_page(QuotePages::rising_quote_page());
    Snapshot snapshot = coordinator.get_current_for_request(false);

    EXPECT_EQ(page_source.get_fetch_count(), 3);
    EXPECT_DOUBLE_EQ(snapshot.price, 1706.0);
}

TEST_F(SnapshotCoordinatorTest, StalenessThresholdFollowsMarketState) {
    EXPECT_EQ(coordinator.get_staleness_threshold(true), seconds(20));
    EXPECT_EQ(coordinator.get_staleness_threshold(false), seconds(300));

    EXPECT_TRUE(coordinator.is_market_open());
    clock.set(QuotePages::taipei_wednesday(18, 0, 0));
    EXPECT_FALSE(coordinator.is_market_open());

    ASSERT_EQ(coordinator.refresh(), RefreshOutcome::SUCCESS);
    clock.advance(seconds(299));
    EXPECT_FALSE(coordinator.is_stale(store.read(), clock.now()));
    clock.advance(seconds(2));
    EXPECT_TRUE(coordinator.is_stale(store.read(), clock.now()));
}

namespace {

// Empty when the snapshot is internally consistent, else what is wrong with it
std::string describe_inconsistency(const Snapshot& snapshot, const DerivedValueCalculator& calculator) {
    if (std::floor(snapshot.price * 4.0) != snapshot.price * 4.0) {
        return "price not on a quarter point: " + std::to_string(snapshot.price);
    }
    bool falling = snapshot.price == 1637.0 && snapshot.change == -68.3 && snapshot.change_percent == -4.0;
    bool rising = snapshot.price == 1706.0 && snapshot.change == 12.4 && snapshot.change_percent == 0.73;
    if (!falling && !rising) {
        return "fields from different pages: price " + std::to_string(snapshot.price) +
               " change " + std::to_string(snapshot.change);
    }
    DerivedValues expected = calculator.calculate(snapshot.price);
    if (snapshot.derived_price != expected.derived_price || snapshot.derived_offset != expected.derived_offset) {
        return "derived values do not match price " + std::to_string(snapshot.price);
    }
    if (snapshot.source != SnapshotSource::LIVE_FETCH || snapshot.error.has_value()) {
        return "unexpected fallback or error";
    }
    return "";
}

} // anonymous namespace

TEST_F(SnapshotCoordinatorTest, ConcurrentReadsNeverSeeMixedSnapshots) {
    RefreshTaskPool pool(2, 4);
    pool.start();
    coordinator.set_refresh_task_pool(&pool);
    ASSERT_EQ(coordinator.refresh(), RefreshOutcome::SUCCESS);

    const DerivedValueCalculator calculator(config.market.derived);
    std::atomic<bool> done{false};
    std::mutex problems_mutex;
    std::vector<std::string> problems;

    auto record_problem = [&](const std::string& problem) {
        std::lock_guard<std::mutex> lock(problems_mutex);
        if (problems.size() < 10) {
            problems.push_back(problem);
        }
    };

    // Pages alternate while the clock keeps every read stale
    std::thread page_toggler([&]() {
        bool rising = false;
        while (!done.load()) {
            rising = !rising;
            page_source.serve_page(rising ? QuotePages::rising_quote_page() : QuotePages::falling_quote_page());
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });

    std::vector<std::thread> readers;
    for (int reader_index = 0; reader_index < 4; ++reader_index) {
        readers.emplace_back([&]() {
            std::chrono::system_clock::time_point last_captured_at;
            while (!done.load()) {
                Snapshot snapshot = coordinator.get_current();
                std::string problem = describe_inconsistency(snapshot, calculator);
                if (!problem.empty()) {
                    record_problem(problem);
                }
                if (snapshot.captured_at < last_captured_at) {
                    record_problem("captured_at moved backwards");
                }
                last_captured_at = snapshot.captured_at;
            }
        });
    }

    // 200 steps of 25s stays inside the 08:45-13:45 session
    for (int step = 0; step < 200; ++step) {
        clock.advance(seconds(25));
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    done.store(true);
    for (std::thread& reader : readers) {
        reader.join();
    }
    page_toggler.join();
    pool.stop();
    coordinator.set_refresh_task_pool(nullptr);

    EXPECT_GT(pool.get_completed_count(), 0u);
    EXPECT_TRUE(problems.empty()) << problems.front();
}
