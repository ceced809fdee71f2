#include "job.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tabrun {

std::string status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::UPLOADED: return "uploaded";
        case JobStatus::PROCESSING: return "processing";
        case JobStatus::RUNNING: return "running";
        case JobStatus::COMPLETED: return "completed";
        case JobStatus::FAILED: return "failed";
        case JobStatus::TIMEOUT: return "timeout";
    }
    return "failed";
}

bool is_terminal(JobStatus status) {
    return status == JobStatus::COMPLETED ||
           status == JobStatus::FAILED ||
           status == JobStatus::TIMEOUT;
}

bool can_transition(JobStatus from, JobStatus to) {
    if (is_terminal(from)) {
        return false;
    }
    if (from == to || to == JobStatus::FAILED) {
        return true;
    }

    switch (from) {
        case JobStatus::UPLOADED:
            return to == JobStatus::PROCESSING;
        case JobStatus::PROCESSING:
            return to == JobStatus::RUNNING;
        case JobStatus::RUNNING:
            return to == JobStatus::COMPLETED || to == JobStatus::TIMEOUT;
        default:
            return false;
    }
}

void JobUpdate::apply_to(JobRecord& record) const {
    if (status) record.status = *status;
    if (input_path) record.input_path = input_path;
    if (code_path) record.code_path = code_path;
    if (result_dir) record.result_dir = result_dir;
    if (stdout_text) record.stdout_text = stdout_text;
    if (stderr_text) record.stderr_text = stderr_text;
    if (exit_code) record.exit_code = exit_code;
    if (error) record.error = error;
    if (runtime_command) record.runtime_command = runtime_command;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    if (millis < 0) millis += 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

Json::Value to_json(const JobRecord& record) {
    Json::Value json;
    json["id"] = record.id;
    json["filename"] = record.filename;
    json["status"] = status_to_string(record.status);
    json["timestamp"] = format_timestamp(record.timestamp);

    if (record.input_path) json["input_path"] = *record.input_path;
    if (record.code_path) json["code_path"] = *record.code_path;
    if (record.result_dir) json["result_dir"] = *record.result_dir;
    if (record.stdout_text) json["stdout"] = *record.stdout_text;
    if (record.stderr_text) json["stderr"] = *record.stderr_text;
    if (record.exit_code) json["exit_code"] = *record.exit_code;
    if (record.error) json["error"] = *record.error;
    if (record.runtime_command) json["docker_cmd"] = *record.runtime_command;

    return json;
}

} // namespace tabrun
