#pragma once

#include "job.h"
#include <string>
#include <vector>

namespace tabrun {

enum class CleanupStatus {
    REMOVED,
    ALREADY_MISSING,
    PERMISSION_DENIED,
    UNEXPECTED_ERROR     // Anything else; logged louder
};

struct CleanupItem {
    std::string path;
    CleanupStatus status = CleanupStatus::REMOVED;
    std::string detail;
};

struct CleanupReport {
    std::string job_id;
    std::vector<CleanupItem> items;

    size_t attempted() const { return items.size(); }
    size_t succeeded() const;
    size_t failed() const;
    bool ok() const { return failed() == 0; }
};

std::string cleanup_status_to_string(CleanupStatus status);

// Deletes a job's input file, code file and result directory.
// Every path is attempted even if an earlier one fails; nothing is thrown.
class ArtifactCleaner {
public:
    static CleanupReport purge(const JobRecord& record);

    // Remove one file or directory tree
    static CleanupItem remove_path(const std::string& path);

    // One log line per failed item, one summary line
    static void log_report(const CleanupReport& report);
};

} // namespace tabrun
