#pragma once

#include "artifact_cleaner.h"
#include "constants.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace tabrun {

class JobRegistry;

struct SweepReport {
    size_t examined = 0;
    size_t expired = 0;
    size_t purged = 0;       // Artifacts gone, entry removed
    size_t failed = 0;       // Some artifact left behind; entry kept for the next cycle
};

// Background purge of expired jobs.
//
// Every interval, jobs created before now - retention are taken out of the
// registry and lose their files. A job whose files could not all be removed
// goes back into the registry for the next cycle. Jobs still PROCESSING or
// RUNNING are left alone until they finish.
//
// A filesystem error on one job never stops the cycle. Any other exception
// ends the cycle (the job being purged is put back) and the loop retries at
// the next interval. stop() takes effect at the next sleep boundary; a cycle
// in progress finishes.
class RetentionSweeper {
public:
    struct Config {
        std::chrono::seconds interval;
        std::chrono::seconds retention;

        Config() :
            interval(SWEEP_INTERVAL_SECONDS),
            retention(std::chrono::hours(RETENTION_HOURS)) {}
    };

    using PurgeFunc = std::function<CleanupReport(const JobRecord&)>;

    explicit RetentionSweeper(JobRegistry& registry, const Config& config = Config(),
                              PurgeFunc purge = &ArtifactCleaner::purge);
    ~RetentionSweeper();

    RetentionSweeper(const RetentionSweeper&) = delete;
    RetentionSweeper& operator=(const RetentionSweeper&) = delete;

    // Start the background thread. False if already running.
    bool start();

    // Idempotent; joins the thread
    void stop();

    bool is_running() const { return running_.load(); }

    // One pass, on the calling thread
    SweepReport run_cycle();
    SweepReport run_cycle(std::chrono::system_clock::time_point now);

    size_t cycles_completed() const { return cycles_.load(); }

private:
    void loop();

    JobRegistry& registry_;
    Config config_;
    PurgeFunc purge_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> cycles_{0};
    bool stop_requested_ = false;
    std::mutex mutex_;
    std::condition_variable wake_;
    std::thread thread_;
};

} // namespace tabrun
