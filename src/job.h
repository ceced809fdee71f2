#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <json/json.h>

namespace tabrun {

// Lifecycle of a job. Order matters: later values are further along.
enum class JobStatus {
    UPLOADED,     // Input stored, waiting for code
    PROCESSING,   // Code accepted, execution dispatched
    RUNNING,      // Container launched
    COMPLETED,    // Exit code 0
    FAILED,       // Non-zero exit, launch error or dispatch error
    TIMEOUT       // Wall clock deadline exceeded
};

std::string status_to_string(JobStatus status);

bool is_terminal(JobStatus status);

// Forward-only transitions:
//   UPLOADED -> PROCESSING -> RUNNING -> {COMPLETED, FAILED, TIMEOUT}
//   any non-terminal -> FAILED
// A non-terminal status may also be re-applied to attach fields.
bool can_transition(JobStatus from, JobStatus to);

struct JobRecord {
    std::string id;
    std::string filename;
    JobStatus status = JobStatus::UPLOADED;
    std::chrono::system_clock::time_point timestamp;

    // Set as the lifecycle advances
    std::optional<std::string> input_path;
    std::optional<std::string> code_path;
    std::optional<std::string> result_dir;

    // Set once the process has exited
    std::optional<std::string> stdout_text;
    std::optional<std::string> stderr_text;
    std::optional<int> exit_code;

    // Only on FAILED / TIMEOUT
    std::optional<std::string> error;

    // Diagnostic only
    std::optional<std::string> runtime_command;
};

// Partial update applied atomically by the registry. Unset fields are left alone.
struct JobUpdate {
    std::optional<JobStatus> status;
    std::optional<std::string> input_path;
    std::optional<std::string> code_path;
    std::optional<std::string> result_dir;
    std::optional<std::string> stdout_text;
    std::optional<std::string> stderr_text;
    std::optional<int> exit_code;
    std::optional<std::string> error;
    std::optional<std::string> runtime_command;

    static JobUpdate to(JobStatus status) {
        JobUpdate update;
        update.status = status;
        return update;
    }

    void apply_to(JobRecord& record) const;
};

// ISO 8601, UTC, millisecond precision
std::string format_timestamp(std::chrono::system_clock::time_point tp);

Json::Value to_json(const JobRecord& record);

} // namespace tabrun
