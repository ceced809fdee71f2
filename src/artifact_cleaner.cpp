#include "artifact_cleaner.h"
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace tabrun {

size_t CleanupReport::succeeded() const {
    size_t count = 0;
    for (const auto& item : items) {
        if (item.status == CleanupStatus::REMOVED || item.status == CleanupStatus::ALREADY_MISSING) {
            ++count;
        }
    }
    return count;
}

size_t CleanupReport::failed() const {
    return attempted() - succeeded();
}

std::string cleanup_status_to_string(CleanupStatus status) {
    switch (status) {
        case CleanupStatus::REMOVED: return "removed";
        case CleanupStatus::ALREADY_MISSING: return "already_missing";
        case CleanupStatus::PERMISSION_DENIED: return "permission_denied";
        case CleanupStatus::UNEXPECTED_ERROR: return "unexpected_error";
    }
    return "unexpected_error";
}

CleanupItem ArtifactCleaner::remove_path(const std::string& path) {
    CleanupItem item;
    item.path = path;

    std::error_code ec;
    fs::file_status st = fs::symlink_status(path, ec);
    if (ec || !fs::exists(st)) {
        if (!ec || ec == std::errc::no_such_file_or_directory) {
            item.status = CleanupStatus::ALREADY_MISSING;
            return item;
        }
    } else if (fs::is_directory(st)) {
        fs::remove_all(path, ec);
    } else {
        fs::remove(path, ec);
    }

    if (!ec) {
        item.status = CleanupStatus::REMOVED;
    } else if (ec == std::errc::no_such_file_or_directory) {
        item.status = CleanupStatus::ALREADY_MISSING;
    } else if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        item.status = CleanupStatus::PERMISSION_DENIED;
        item.detail = ec.message();
    } else {
        item.status = CleanupStatus::UNEXPECTED_ERROR;
        item.detail = ec.message();
    }
    return item;
}

CleanupReport ArtifactCleaner::purge(const JobRecord& record) {
    CleanupReport report;
    report.job_id = record.id;

    for (const auto* path : {&record.input_path, &record.code_path, &record.result_dir}) {
        if (path->has_value() && !(*path)->empty()) {
            report.items.push_back(remove_path(**path));
        }
    }
    return report;
}

void ArtifactCleaner::log_report(const CleanupReport& report) {
    for (const auto& item : report.items) {
        if (item.status == CleanupStatus::PERMISSION_DENIED ||
            item.status == CleanupStatus::UNEXPECTED_ERROR) {
            std::cerr << "[Cleaner] " << cleanup_status_to_string(item.status) << " removing "
                      << item.path << " for job " << report.job_id << ": " << item.detail
                      << std::endl;
        }
    }
    std::cout << "[Cleaner] Job " << report.job_id << ": " << report.succeeded() << "/"
              << report.attempted() << " artifacts cleaned" << std::endl;
}

} // namespace tabrun
