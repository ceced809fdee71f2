#pragma once

#include "config.h"
#include "file_utils.h"
#include "job.h"
#include "sandbox.h"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace tabrun {

class JobRegistry;

// Bad upload: empty name, disallowed extension, oversized payload
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

enum class Outcome {
    OK,
    REJECTED,     // Code failed the denylist filter
    NOT_FOUND,
    CONFLICT,     // Job is not in a state that accepts this call
    NOT_READY     // Result requested before the job completed
};

struct SubmitResult {
    Outcome outcome = Outcome::OK;
    std::string reason;
};

// A result file picked for download
struct ResultFile {
    Outcome outcome = Outcome::NOT_FOUND;    // OK, NOT_READY or NOT_FOUND
    std::string reason;
    JobStatus job_status = JobStatus::UPLOADED;
    std::string path;
    std::string download_name;
    std::string mime_type;
    FileMetadata metadata;
};

// Job lifecycle API used by the HTTP front end.
//
//   create_job / upload_file  -> UPLOADED
//   submit_code               -> PROCESSING, then execution on its own thread
//   executor                  -> RUNNING -> COMPLETED | FAILED | TIMEOUT
//
// Nothing after submit_code returns is reported synchronously; callers poll
// get_status(). Destruction stops new dispatches and waits for executions
// still in flight.
class JobCoordinator {
public:
    JobCoordinator(JobRegistry& registry, SandboxExecutor& executor, const ServiceConfig& config);
    ~JobCoordinator();

    JobCoordinator(const JobCoordinator&) = delete;
    JobCoordinator& operator=(const JobCoordinator&) = delete;

    // New job in UPLOADED. Throws ValidationError.
    std::string create_job(const std::string& filename);

    // CONFLICT if an input is already attached or the job left UPLOADED
    Outcome attach_input(const std::string& job_id, const std::string& path);

    // create_job + size check + store bytes + attach_input. Throws ValidationError.
    std::string upload_file(const std::string& filename, const std::string& content);

    // Filter, move to PROCESSING, dispatch. Returns as soon as execution is
    // handed off.
    SubmitResult submit_code(const std::string& job_id, const std::string& source);

    std::optional<JobRecord> get_status(const std::string& job_id) const;

    // preferred_format: "json", "csv" or "excel" (anything else means json).
    // Falls back to the first JSON file, then to the first file.
    ResultFile get_result(const std::string& job_id, const std::string& preferred_format) const;

    // Removes the entry, then its artifacts. Leftover files are logged, not
    // reported. Files an in-flight execution writes afterwards are removed
    // when that execution ends.
    Outcome delete_job(const std::string& job_id);

    // Example processing code
    static std::string get_template();

    size_t in_flight() const;

    // From here on submit_code returns CONFLICT and nothing new is
    // dispatched. The destructor calls it.
    void begin_shutdown();
    bool is_shutting_down() const;

    // Wait until no execution is running. False on timeout.
    bool wait_idle(std::chrono::milliseconds timeout);

private:
    void dispatch(const ExecutionRequest& request);
    void discard_if_deleted(const ExecutionRequest& request);
    void finish_execution();

    JobRegistry& registry_;
    SandboxExecutor& executor_;
    ServiceConfig config_;

    mutable std::mutex dispatch_mutex_;
    std::condition_variable idle_;
    size_t in_flight_ = 0;
    bool shutting_down_ = false;
};

} // namespace tabrun
