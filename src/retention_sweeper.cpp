#include "retention_sweeper.h"
#include "artifact_cleaner.h"
#include "job_registry.h"
#include <filesystem>
#include <iostream>

namespace tabrun {

RetentionSweeper::RetentionSweeper(JobRegistry& registry, const Config& config, PurgeFunc purge)
    : registry_(registry), config_(config), purge_(std::move(purge)) {}

RetentionSweeper::~RetentionSweeper() {
    stop();
}

bool RetentionSweeper::start() {
    if (running_.exchange(true)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread(&RetentionSweeper::loop, this);
    std::cout << "[Sweeper] Started (interval " << config_.interval.count()
              << "s, retention " << config_.retention.count() << "s)" << std::endl;
    return true;
}

void RetentionSweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    wake_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
        std::cout << "[Sweeper] Stopped" << std::endl;
    }
    running_.store(false);
}

void RetentionSweeper::loop() {
    while (true) {
        try {
            SweepReport report = run_cycle();
            if (report.expired > 0) {
                std::cout << "[Sweeper] Purged " << report.purged << "/" << report.expired
                          << " expired jobs (" << report.failed << " with leftovers)" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[Sweeper] Cycle failed, retrying next interval: " << e.what() << std::endl;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        if (wake_.wait_for(lock, config_.interval, [this] { return stop_requested_; })) {
            return;
        }
    }
}

SweepReport RetentionSweeper::run_cycle() {
    return run_cycle(std::chrono::system_clock::now());
}

SweepReport RetentionSweeper::run_cycle(std::chrono::system_clock::time_point now) {
    SweepReport report;
    auto cutoff = now - config_.retention;

    auto expired = [cutoff](const JobRecord& record) {
        bool active = record.status == JobStatus::PROCESSING || record.status == JobStatus::RUNNING;
        return record.timestamp < cutoff && !active;
    };

    for (const auto& job_id : registry_.list_ids()) {
        ++report.examined;

        // Gone or not yet expired since list_ids()
        auto record = registry_.take_if(job_id, expired);
        if (!record) {
            continue;
        }
        ++report.expired;

        CleanupReport cleanup;
        try {
            cleanup = purge_(*record);
        } catch (const std::filesystem::filesystem_error& e) {
            std::cerr << "[Sweeper] Failed to purge job " << job_id << ": " << e.what() << std::endl;
            registry_.put(job_id, std::move(*record));
            ++report.failed;
            continue;
        } catch (...) {
            registry_.put(job_id, std::move(*record));
            throw;
        }
        ArtifactCleaner::log_report(cleanup);

        if (cleanup.ok()) {
            ++report.purged;
        } else {
            // Files remain: the next cycle retries them
            registry_.put(job_id, std::move(*record));
            ++report.failed;
        }
    }

    ++cycles_;
    return report;
}

} // namespace tabrun
