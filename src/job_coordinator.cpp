#include "job_coordinator.h"
#include "artifact_cleaner.h"
#include "code_filter.h"
#include "job_id.h"
#include "job_registry.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

namespace tabrun {

namespace {

std::string supported_formats(const std::set<std::string>& allowed) {
    std::string joined;
    for (const auto& ext : allowed) {
        if (!joined.empty()) joined += ", ";
        joined += ext;
    }
    return joined;
}

// Name-ordered files of the given type
std::optional<std::string> first_of_type(const std::vector<std::string>& files, FileType type) {
    for (const auto& file : files) {
        if (FileUtils::detect_file_type(file) == type) {
            return file;
        }
    }
    return std::nullopt;
}

bool write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    return static_cast<bool>(out);
}

std::string sanitized_or_throw(const std::string& filename, const std::set<std::string>& allowed) {
    std::string name = FileUtils::sanitize_filename(filename);
    if (name.empty()) {
        throw ValidationError("No file selected");
    }
    if (!FileUtils::has_allowed_extension(name, allowed)) {
        throw ValidationError("File type not allowed. Supported formats: " +
                              supported_formats(allowed));
    }
    return name;
}

} // namespace

JobCoordinator::JobCoordinator(JobRegistry& registry, SandboxExecutor& executor,
                               const ServiceConfig& config)
    : registry_(registry), executor_(executor), config_(config) {}

JobCoordinator::~JobCoordinator() {
    begin_shutdown();
    std::unique_lock<std::mutex> lock(dispatch_mutex_);
    if (in_flight_ > 0) {
        std::cout << "[Coordinator] Waiting for " << in_flight_
                  << " running job(s) to finish" << std::endl;
    }
    idle_.wait(lock, [this] { return in_flight_ == 0; });
}

std::string JobCoordinator::create_job(const std::string& filename) {
    std::string name = sanitized_or_throw(filename, config_.allowed_extensions);

    JobRecord record;
    record.filename = name;
    record.status = JobStatus::UPLOADED;
    record.timestamp = std::chrono::system_clock::now();

    std::string job_id = generate_job_id();
    registry_.put(job_id, std::move(record));
    return job_id;
}

Outcome JobCoordinator::attach_input(const std::string& job_id, const std::string& path) {
    JobUpdate update;
    update.input_path = path;

    auto result = registry_.update_if(
        job_id,
        [](const JobRecord& record) {
            return record.status == JobStatus::UPLOADED && !record.input_path;
        },
        update);

    switch (result) {
        case UpdateOutcome::APPLIED: return Outcome::OK;
        case UpdateOutcome::NOT_FOUND: return Outcome::NOT_FOUND;
        case UpdateOutcome::CONFLICT: return Outcome::CONFLICT;
    }
    return Outcome::CONFLICT;
}

std::string JobCoordinator::upload_file(const std::string& filename, const std::string& content) {
    std::string name = sanitized_or_throw(filename, config_.allowed_extensions);
    if (content.size() > config_.max_upload_bytes) {
        throw ValidationError("File too large. Maximum size: " +
                              FileUtils::format_file_size(config_.max_upload_bytes));
    }

    std::string job_id = create_job(name);
    std::string path = (fs::path(config_.upload_dir()) / (job_id + "_" + name)).string();

    if (!write_file(path, content)) {
        registry_.erase(job_id);
        std::error_code ec;
        fs::remove(path, ec);
        throw std::runtime_error("Failed to store upload " + name);
    }

    if (attach_input(job_id, path) != Outcome::OK) {
        // Only possible if the job was deleted in between
        throw std::runtime_error("Job " + job_id + " disappeared during upload");
    }

    std::cout << "[Coordinator] Job " << job_id << " uploaded " << name << " ("
              << FileUtils::format_file_size(content.size()) << ")" << std::endl;
    return job_id;
}

SubmitResult JobCoordinator::submit_code(const std::string& job_id, const std::string& source) {
    auto snapshot = registry_.get(job_id);
    if (!snapshot) {
        return {Outcome::NOT_FOUND, "Job not found"};
    }

    FilterResult filter = CodeFilter::validate(source);
    if (!filter.ok) {
        std::cout << "[Coordinator] Job " << job_id << " code rejected (" << filter.token << ")"
                  << std::endl;
        return {Outcome::REJECTED, "Forbidden module or function detected: " + filter.token};
    }

    if (!snapshot->input_path) {
        return {Outcome::CONFLICT, "No input file attached"};
    }
    if (is_shutting_down()) {
        return {Outcome::CONFLICT, "Service is shutting down"};
    }

    std::string code_path = (fs::path(config_.code_dir()) / (job_id + "_process.py")).string();
    std::string result_dir = (fs::path(config_.results_dir()) / job_id).string();

    JobUpdate update = JobUpdate::to(JobStatus::PROCESSING);
    update.code_path = code_path;
    update.result_dir = result_dir;

    auto claimed = registry_.update_if(
        job_id,
        [](const JobRecord& record) {
            return record.status == JobStatus::UPLOADED && record.input_path.has_value();
        },
        update);

    if (claimed == UpdateOutcome::NOT_FOUND) {
        return {Outcome::NOT_FOUND, "Job not found"};
    }
    if (claimed == UpdateOutcome::CONFLICT) {
        auto current = registry_.get(job_id);
        std::string state = current ? status_to_string(current->status) : "deleted";
        return {Outcome::CONFLICT, "Job already submitted (status: " + state + ")"};
    }

    ExecutionRequest request;
    request.job_id = job_id;
    request.input_path = *snapshot->input_path;
    request.code_path = code_path;
    request.result_dir = result_dir;
    request.timeout = config_.timeout;

    try {
        if (!write_file(code_path, source)) {
            throw std::runtime_error("cannot write " + code_path);
        }
        fs::create_directories(result_dir);
        dispatch(request);
    } catch (const std::exception& e) {
        std::cerr << "[Coordinator] Job " << job_id << " dispatch failed: " << e.what() << std::endl;
        JobUpdate failed = JobUpdate::to(JobStatus::FAILED);
        failed.error = std::string("Exception: ") + e.what();
        registry_.update(job_id, failed);
        discard_if_deleted(request);
    }

    return {Outcome::OK, ""};
}

std::optional<JobRecord> JobCoordinator::get_status(const std::string& job_id) const {
    return registry_.get(job_id);
}

ResultFile JobCoordinator::get_result(const std::string& job_id,
                                      const std::string& preferred_format) const {
    ResultFile result;

    auto record = registry_.get(job_id);
    if (!record) {
        result.outcome = Outcome::NOT_FOUND;
        result.reason = "Job not found";
        return result;
    }
    result.job_status = record->status;

    if (record->status != JobStatus::COMPLETED) {
        result.outcome = Outcome::NOT_READY;
        result.reason = "Results not available yet";
        return result;
    }

    std::vector<std::string> files;
    if (record->result_dir) {
        files = FileUtils::list_files(*record->result_dir);
    }
    if (files.empty()) {
        result.outcome = Outcome::NOT_FOUND;
        result.reason = "No results found";
        return result;
    }

    std::optional<std::string> chosen;
    std::string download_name;

    if (preferred_format == "csv") {
        chosen = first_of_type(files, FileType::CSV);
        if (chosen) download_name = "result_" + job_id + ".csv";
    } else if (preferred_format == "excel") {
        chosen = first_of_type(files, FileType::EXCEL);
        if (chosen) download_name = "result_" + job_id + FileUtils::extension_of(*chosen);
    }

    if (!chosen) {
        chosen = first_of_type(files, FileType::JSON);
        if (chosen) download_name = "result_" + job_id + ".json";
    }
    if (!chosen) {
        chosen = files.front();
        download_name = "result_" + job_id + "_" + *chosen;
    }

    result.outcome = Outcome::OK;
    result.path = (fs::path(*record->result_dir) / *chosen).string();
    result.download_name = download_name;
    result.mime_type = FileUtils::get_mime_type(*chosen);
    result.metadata = FileUtils::get_file_metadata(result.path);
    return result;
}

Outcome JobCoordinator::delete_job(const std::string& job_id) {
    // Entry goes even when files are left behind; the log line is the record of it
    auto record = registry_.take(job_id);
    if (!record) {
        return Outcome::NOT_FOUND;
    }

    CleanupReport report = ArtifactCleaner::purge(*record);
    ArtifactCleaner::log_report(report);
    std::cout << "[Coordinator] Job " << job_id << " deleted" << std::endl;
    return Outcome::OK;
}

std::string JobCoordinator::get_template() {
    return R"(import pandas as pd

# The uploaded file is mounted read-only at /data/input_file.<ext>
# (.csv, .xlsx or .xls). Anything written to /data/output/ is returned
# as the job result.

df = pd.read_csv('/data/input_file.csv')
# df = pd.read_excel('/data/input_file.xlsx')

summary = {
    'row_count': len(df),
    'column_count': len(df.columns),
    'columns': list(df.columns),
}
pd.Series(summary).to_json('/data/output/result.json')

processed_data = df.describe()
processed_data.to_csv('/data/output/processed_data.csv')
)";
}

size_t JobCoordinator::in_flight() const {
    std::lock_guard<std::mutex> lock(dispatch_mutex_);
    return in_flight_;
}

bool JobCoordinator::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(dispatch_mutex_);
    return idle_.wait_for(lock, timeout, [this] { return in_flight_ == 0; });
}

void JobCoordinator::begin_shutdown() {
    std::lock_guard<std::mutex> lock(dispatch_mutex_);
    shutting_down_ = true;
}

bool JobCoordinator::is_shutting_down() const {
    std::lock_guard<std::mutex> lock(dispatch_mutex_);
    return shutting_down_;
}

void JobCoordinator::dispatch(const ExecutionRequest& request) {
    {
        std::lock_guard<std::mutex> lock(dispatch_mutex_);
        if (shutting_down_) {
            throw std::runtime_error("Service is shutting down");
        }
        ++in_flight_;
    }

    try {
        std::thread([this, request] {
            executor_.execute(request);
            discard_if_deleted(request);
            finish_execution();
        }).detach();
    } catch (...) {
        finish_execution();
        throw;
    }

    std::cout << "[Coordinator] Job " << request.job_id << " dispatched" << std::endl;
}

// A delete that lands after the claim purges the paths it saw, but the code
// file and result directory may be written after that. Called once nothing
// writes to them any more.
void JobCoordinator::discard_if_deleted(const ExecutionRequest& request) {
    if (registry_.get(request.job_id)) {
        return;
    }

    JobRecord leftovers;
    leftovers.id = request.job_id;
    leftovers.code_path = request.code_path;
    leftovers.result_dir = request.result_dir;

    std::cout << "[Coordinator] Job " << request.job_id
              << " was deleted before it finished, removing its files" << std::endl;
    ArtifactCleaner::log_report(ArtifactCleaner::purge(leftovers));
}

void JobCoordinator::finish_execution() {
    std::lock_guard<std::mutex> lock(dispatch_mutex_);
    --in_flight_;
    idle_.notify_all();
}

} // namespace tabrun
