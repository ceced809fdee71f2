#pragma once

#include <string>
#include <vector>
#include <chrono>
#include "constants.h"
#include "job.h"

namespace tabrun {

class JobRegistry;
class ProcessLauncher;

enum class HostPlatform {
    POSIX,
    WINDOWS
};

// Platform this binary was built for
HostPlatform native_platform();

// Translate a host path into the syntax the container runtime expects.
// WINDOWS: "C:\Users\a\in.csv" -> "/c/Users/a/in.csv". POSIX: unchanged.
std::string normalize_host_path(const std::string& path, HostPlatform platform);

// Sandbox configuration
struct SandboxConfig {
    std::string runtime = "docker";                  // Container runtime CLI
    std::string image = "python-sandbox";            // Image with the data stack installed
    std::vector<std::string> command = {"sh", "-c", "cd /data && python -m process"};
    size_t memory_limit_mb = DEFAULT_MEMORY_LIMIT_MB;
    int cpu_shares = DEFAULT_CPU_SHARES;
    bool allow_network = false;                      // Airgapped by default
    std::chrono::seconds kill_grace = std::chrono::seconds(KILL_GRACE_SECONDS);
    HostPlatform platform = native_platform();
};

// One job's execution inputs
struct ExecutionRequest {
    std::string job_id;
    std::string input_path;
    std::string code_path;
    std::string result_dir;
    std::chrono::seconds timeout = std::chrono::seconds(DEFAULT_TIMEOUT_SECONDS);
};

// Fully built runtime command line
struct SandboxInvocation {
    std::vector<std::string> argv;
    std::string container_name;

    // Shell-like rendering for logs and the job's diagnostic field
    std::string to_string() const;
};

// Runs a job's code against its input inside a container and records the
// outcome in the registry.
//
// The host-side wait is authoritative for the deadline. On timeout the
// runtime client's process group is killed and the container itself is
// killed by name, so the inner process stops too; the runtime's
// --stop-timeout is only a backstop.
//
// Output read before a timeout kill is kept in the record (same on every
// platform).
class SandboxExecutor {
public:
    SandboxExecutor(JobRegistry& registry, ProcessLauncher& launcher,
                    const SandboxConfig& config = SandboxConfig{});

    // Build the runtime argv for request. Throws std::invalid_argument on a
    // non-positive timeout or missing paths in the request.
    SandboxInvocation build_invocation(const ExecutionRequest& request) const;

    // Drive the job to a terminal state. Blocks the calling thread for at
    // most timeout + 2 * kill_grace. Never throws; every failure ends up in
    // the registry as FAILED. A job that is no longer registered, or cannot
    // move to RUNNING, is not launched and FAILED is returned.
    JobStatus execute(const ExecutionRequest& request);

    const SandboxConfig& config() const { return config_; }

private:
    void stop_container(const std::string& container_name);

    JobRegistry& registry_;
    ProcessLauncher& launcher_;
    SandboxConfig config_;
};

} // namespace tabrun
