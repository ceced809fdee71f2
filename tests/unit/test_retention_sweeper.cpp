#include <gtest/gtest.h>
#include "retention_sweeper.h"
#include "job_registry.h"
#include <atomic>
#include <cstdlib>
#include <stdexcept>
#include <filesystem>
#include <fstream>
#include <thread>

namespace tabrun {
namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class RetentionSweeperTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/tabrun_sweeper_XXXXXX";
        char* dir = mkdtemp(tmpl);
        ASSERT_NE(dir, nullptr);
        test_dir = dir;

        config.interval = std::chrono::seconds(3600);
        config.retention = std::chrono::hours(24);
        now = std::chrono::system_clock::now();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    // Job created `age` ago with an input file and a result directory
    JobRecord add_job(const std::string& id, std::chrono::system_clock::duration age) {
        fs::path input = test_dir / (id + "_data.csv");
        std::ofstream(input) << "a\n1\n";
        fs::path results = test_dir / "results" / id;
        fs::create_directories(results);
        std::ofstream(results / "result.json") << "{}";

        JobRecord record;
        record.filename = "data.csv";
        record.status = JobStatus::COMPLETED;
        record.timestamp = now - age;
        record.input_path = input.string();
        record.result_dir = results.string();
        registry.put(id, record);
        record.id = id;
        return record;
    }

    fs::path test_dir;
    JobRegistry registry;
    RetentionSweeper::Config config;
    std::chrono::system_clock::time_point now;
};

TEST_F(RetentionSweeperTest, ExpiredJobsArePurgedYoungOnesKept) {
    JobRecord old_job = add_job("old", 25h);
    JobRecord young_job = add_job("young", 1h);

    RetentionSweeper sweeper(registry, config);
    SweepReport report = sweeper.run_cycle(now);

    EXPECT_EQ(report.examined, 2u);
    EXPECT_EQ(report.expired, 1u);
    EXPECT_EQ(report.purged, 1u);
    EXPECT_EQ(report.failed, 0u);

    EXPECT_FALSE(registry.get("old").has_value());
    EXPECT_FALSE(fs::exists(*old_job.input_path));
    EXPECT_FALSE(fs::exists(*old_job.result_dir));

    EXPECT_TRUE(registry.get("young").has_value());
    EXPECT_TRUE(fs::exists(*young_job.input_path));
    EXPECT_TRUE(fs::exists(*young_job.result_dir));
}

TEST_F(RetentionSweeperTest, RetentionBoundaryIsExclusive) {
    add_job("edge", 24h);

    RetentionSweeper sweeper(registry, config);
    SweepReport report = sweeper.run_cycle(now);

    EXPECT_EQ(report.expired, 0u) << "exactly retention old is not yet expired";
    EXPECT_TRUE(registry.get("edge").has_value());
}

TEST_F(RetentionSweeperTest, EntryKeptWhileArtifactsRemain) {
    JobRecord stuck = add_job("stuck", 48h);

    JobUpdate update;
    // ENAMETOOLONG: reported as a failure, never as already missing
    update.code_path = (test_dir / std::string(300, 'z')).string();
    registry.update("stuck", update);

    RetentionSweeper sweeper(registry, config);
    SweepReport report = sweeper.run_cycle(now);

    EXPECT_EQ(report.expired, 1u);
    EXPECT_EQ(report.purged, 0u);
    EXPECT_EQ(report.failed, 1u);
    EXPECT_TRUE(registry.get("stuck").has_value()) << "retried next cycle";
    EXPECT_FALSE(fs::exists(*stuck.input_path)) << "the rest is still removed";
}

TEST_F(RetentionSweeperTest, ActiveJobsAreLeftAlone) {
    add_job("finished", 48h);
    JobRecord busy;
    busy.filename = "data.csv";
    busy.status = JobStatus::RUNNING;
    busy.timestamp = now - 48h;
    registry.put("busy", busy);

    RetentionSweeper sweeper(registry, config);
    SweepReport report = sweeper.run_cycle(now);

    EXPECT_EQ(report.expired, 1u);
    EXPECT_FALSE(registry.get("finished").has_value());
    EXPECT_TRUE(registry.get("busy").has_value()) << "swept once it finishes";
}

TEST_F(RetentionSweeperTest, FilesystemErrorOnOneJobDoesNotStopTheCycle) {
    add_job("a", 30h);
    add_job("b", 30h);

    RetentionSweeper sweeper(registry, config, [](const JobRecord& record) {
        if (record.id == "a") {
            throw fs::filesystem_error("read-only mount", std::make_error_code(std::errc::io_error));
        }
        return ArtifactCleaner::purge(record);
    });
    SweepReport report = sweeper.run_cycle(now);

    EXPECT_EQ(report.expired, 2u);
    EXPECT_EQ(report.purged, 1u);
    EXPECT_EQ(report.failed, 1u);
    EXPECT_TRUE(registry.get("a").has_value()) << "kept for the next cycle";
    EXPECT_FALSE(registry.get("b").has_value());
}

TEST_F(RetentionSweeperTest, FailedCycleKeepsTheJob) {
    add_job("old", 30h);

    RetentionSweeper sweeper(registry, config, [](const JobRecord&) -> CleanupReport {
        throw std::runtime_error("out of memory");
    });

    EXPECT_THROW(sweeper.run_cycle(now), std::runtime_error);
    EXPECT_TRUE(registry.get("old").has_value());
    EXPECT_EQ(sweeper.cycles_completed(), 0u);
}

TEST_F(RetentionSweeperTest, LoopSurvivesAFailedCycle) {
    JobRecord old_job = add_job("old", 30h);
    config.interval = std::chrono::seconds(1);

    // First attempt blows up the whole cycle; the next interval succeeds
    std::atomic<int> attempts{0};
    RetentionSweeper sweeper(registry, config, [&attempts](const JobRecord& record) {
        if (attempts++ == 0) {
            throw std::runtime_error("out of memory");
        }
        return ArtifactCleaner::purge(record);
    });
    ASSERT_TRUE(sweeper.start());

    auto deadline = std::chrono::steady_clock::now() + 10s;
    while (registry.get("old").has_value() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }
    sweeper.stop();

    EXPECT_GE(attempts.load(), 2);
    EXPECT_FALSE(registry.get("old").has_value());
    EXPECT_FALSE(fs::exists(*old_job.input_path));
    EXPECT_GE(sweeper.cycles_completed(), 1u);
}

TEST_F(RetentionSweeperTest, EmptyRegistryIsANoOp) {
    RetentionSweeper sweeper(registry, config);
    SweepReport report = sweeper.run_cycle();
    EXPECT_EQ(report.examined, 0u);
    EXPECT_EQ(sweeper.cycles_completed(), 1u);
}

TEST_F(RetentionSweeperTest, BackgroundLoopSweepsOnStart) {
    add_job("old", 30h);
    add_job("young", 1h);

    RetentionSweeper sweeper(registry, config);
    ASSERT_TRUE(sweeper.start());
    EXPECT_TRUE(sweeper.is_running());

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (registry.get("old").has_value() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }

    EXPECT_FALSE(registry.get("old").has_value());
    EXPECT_TRUE(registry.get("young").has_value());
    sweeper.stop();
    EXPECT_GE(sweeper.cycles_completed(), 1u);
}

TEST_F(RetentionSweeperTest, StopInterruptsTheSleep) {
    RetentionSweeper sweeper(registry, config);    // One hour interval
    ASSERT_TRUE(sweeper.start());
    EXPECT_FALSE(sweeper.start()) << "second start is refused";

    auto start = std::chrono::steady_clock::now();
    sweeper.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_FALSE(sweeper.is_running());

    // Idempotent
    sweeper.stop();
    EXPECT_FALSE(sweeper.is_running());
}

TEST_F(RetentionSweeperTest, CanRestartAfterStop) {
    RetentionSweeper sweeper(registry, config);
    ASSERT_TRUE(sweeper.start());
    sweeper.stop();
    ASSERT_TRUE(sweeper.start());
    sweeper.stop();
    EXPECT_FALSE(sweeper.is_running());
}

TEST(RetentionSweeperConfigTest, DefaultsAreHourlyWithOneDayRetention) {
    RetentionSweeper::Config config;
    EXPECT_EQ(config.interval, std::chrono::seconds(3600));
    EXPECT_EQ(config.retention, std::chrono::hours(24));
}

} // namespace
} // namespace tabrun
