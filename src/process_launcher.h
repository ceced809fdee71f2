#pragma once

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <stdexcept>

namespace tabrun {

// The process could not be started at all (binary missing, pipe/fork failure)
class LaunchError : public std::runtime_error {
public:
    explicit LaunchError(const std::string& message)
        : std::runtime_error(message) {}
};

// A launched process with stdout/stderr captured into separate buffers.
// stdin is the null device; the caller's streams are never inherited.
class ChildProcess {
public:
    virtual ~ChildProcess() = default;

    // Pump output until the process exits or timeout elapses.
    // Returns true once the process has exited; exit_code() is then valid.
    virtual bool wait_for(std::chrono::milliseconds timeout) = 0;

    // Exit status, or -signal when killed by a signal (POSIX)
    virtual int exit_code() const = 0;

    // Forcibly stop the process and everything it spawned. Does not wait.
    virtual void kill() = 0;

    virtual bool is_running() = 0;

    virtual long pid() const = 0;

    // Output captured so far (complete once wait_for returned true)
    virtual const std::string& stdout_text() const = 0;
    virtual const std::string& stderr_text() const = 0;
};

// Host-specific way of starting processes. One implementation per platform;
// callers only ever see this interface.
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // argv[0] is looked up on PATH. Throws LaunchError if nothing was started.
    virtual std::unique_ptr<ChildProcess> launch(const std::vector<std::string>& argv) = 0;
};

// Launcher for the platform this binary was built for
std::unique_ptr<ProcessLauncher> make_native_launcher();

} // namespace tabrun
