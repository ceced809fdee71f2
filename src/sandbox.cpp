#include "sandbox.h"
#include "job_registry.h"
#include "process_launcher.h"
#include "file_utils.h"
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace tabrun {

HostPlatform native_platform() {
#ifdef _WIN32
    return HostPlatform::WINDOWS;
#else
    return HostPlatform::POSIX;
#endif
}

std::string normalize_host_path(const std::string& path, HostPlatform platform) {
    if (platform != HostPlatform::WINDOWS) {
        return path;
    }

    std::string normalized = path;
    for (char& c : normalized) {
        if (c == '\\') c = '/';
    }

    // Drive letter: "C:/x" -> "/c/x"
    if (normalized.size() >= 2 && normalized[1] == ':' &&
        std::isalpha(static_cast<unsigned char>(normalized[0]))) {
        char drive = static_cast<char>(std::tolower(static_cast<unsigned char>(normalized[0])));
        normalized = "/" + std::string(1, drive) + normalized.substr(2);
    }
    return normalized;
}

std::string SandboxInvocation::to_string() const {
    std::ostringstream out;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) out << ' ';
        const std::string& arg = argv[i];
        if (arg.empty() || arg.find_first_of(" \t\"'&|;") != std::string::npos) {
            out << '"';
            for (char c : arg) {
                if (c == '"' || c == '\\') out << '\\';
                out << c;
            }
            out << '"';
        } else {
            out << arg;
        }
    }
    return out.str();
}

SandboxExecutor::SandboxExecutor(JobRegistry& registry, ProcessLauncher& launcher,
                                 const SandboxConfig& config)
    : registry_(registry), launcher_(launcher), config_(config) {}

SandboxInvocation SandboxExecutor::build_invocation(const ExecutionRequest& request) const {
    if (request.timeout.count() <= 0) {
        throw std::invalid_argument("Timeout must be positive");
    }
    if (request.input_path.empty() || request.code_path.empty() || request.result_dir.empty()) {
        throw std::invalid_argument("Input, code and result paths are required");
    }

    std::string input = normalize_host_path(request.input_path, config_.platform);
    std::string code = normalize_host_path(request.code_path, config_.platform);
    std::string results = normalize_host_path(request.result_dir, config_.platform);
    std::string ext = FileUtils::extension_of(request.input_path);
    std::string timeout = std::to_string(request.timeout.count());

    SandboxInvocation invocation;
    invocation.container_name = "tabrun-" + request.job_id;

    auto& argv = invocation.argv;
    argv = {
        config_.runtime, "run", "--rm",
        "--name", invocation.container_name,
        // Resource limits
        "--memory=" + std::to_string(config_.memory_limit_mb) + "m",
        "--cpu-shares=" + std::to_string(config_.cpu_shares),
        // Backstop only; the host-side wait enforces the deadline
        "--stop-timeout=" + timeout,
    };
    if (!config_.allow_network) {
        argv.push_back("--network=none");
    }

    argv.push_back("-v");
    argv.push_back(input + ":" + CONTAINER_INPUT_STEM + ext + ":ro");
    argv.push_back("-v");
    argv.push_back(code + ":" + CONTAINER_CODE_PATH + ":ro");
    argv.push_back("-v");
    argv.push_back(results + ":" + CONTAINER_OUTPUT_DIR + ":rw");

    argv.push_back(config_.image);
    argv.insert(argv.end(), config_.command.begin(), config_.command.end());

    return invocation;
}

JobStatus SandboxExecutor::execute(const ExecutionRequest& request) {
    const std::string& job_id = request.job_id;
    if (!registry_.update(job_id, JobUpdate::to(JobStatus::RUNNING))) {
        std::cout << "[Sandbox] Job " << job_id << " deleted or already finished, not launching"
                  << std::endl;
        return JobStatus::FAILED;
    }

    try {
        SandboxInvocation invocation = build_invocation(request);
        std::string command_line = invocation.to_string();

        std::cout << "[Sandbox] Executing job " << job_id << ": " << command_line << std::endl;
        JobUpdate diagnostic = JobUpdate::to(JobStatus::RUNNING);
        diagnostic.runtime_command = command_line;
        registry_.update(job_id, diagnostic);

        auto child = launcher_.launch(invocation.argv);

        if (child->wait_for(request.timeout)) {
            JobUpdate done;
            done.stdout_text = child->stdout_text();
            done.stderr_text = child->stderr_text();
            done.exit_code = child->exit_code();

            if (child->exit_code() == 0) {
                done.status = JobStatus::COMPLETED;
            } else {
                done.status = JobStatus::FAILED;
                done.error = "Exit code: " + std::to_string(child->exit_code()) +
                             "\nStderr: " + child->stderr_text();
            }
            registry_.update(job_id, done);

            std::cout << "[Sandbox] Job " << job_id << " " << status_to_string(*done.status)
                      << " (exit=" << child->exit_code() << ")" << std::endl;
            return *done.status;
        }

        // Deadline passed: stop the client, then the container behind it
        child->kill();
        stop_container(invocation.container_name);

        JobUpdate timed_out = JobUpdate::to(JobStatus::TIMEOUT);
        timed_out.error = "Execution timed out after " +
                          std::to_string(request.timeout.count()) + " seconds";

        if (child->wait_for(config_.kill_grace)) {
            timed_out.stdout_text = child->stdout_text();
            timed_out.stderr_text = child->stderr_text();
        } else {
            std::cerr << "[Sandbox] Warning: job " << job_id << " (pid " << child->pid()
                      << ") still running after kill" << std::endl;
        }
        registry_.update(job_id, timed_out);

        std::cout << "[Sandbox] Job " << job_id << " timed out after "
                  << request.timeout.count() << "s" << std::endl;
        return JobStatus::TIMEOUT;

    } catch (const std::exception& e) {
        std::cerr << "[Sandbox] Job " << job_id << " failed to execute: " << e.what() << std::endl;
        JobUpdate failed = JobUpdate::to(JobStatus::FAILED);
        failed.error = std::string("Exception: ") + e.what();
        registry_.update(job_id, failed);
        return JobStatus::FAILED;
    }
}

void SandboxExecutor::stop_container(const std::string& container_name) {
    try {
        auto killer = launcher_.launch({config_.runtime, "kill", container_name});
        if (!killer->wait_for(config_.kill_grace)) {
            killer->kill();
            std::cerr << "[Sandbox] Warning: '" << config_.runtime << " kill "
                      << container_name << "' did not finish" << std::endl;
        } else if (killer->exit_code() != 0) {
            // Usual when the container was never created or already gone
            std::cerr << "[Sandbox] " << config_.runtime << " kill " << container_name
                      << " exited with " << killer->exit_code() << std::endl;
        }
    } catch (const LaunchError& e) {
        std::cerr << "[Sandbox] Could not stop container " << container_name
                  << ": " << e.what() << std::endl;
    }
}

} // namespace tabrun
