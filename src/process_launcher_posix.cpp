#include "process_launcher.h"
#include "constants.h"

#include <spawn.h>
#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

extern char** environ;

namespace tabrun {

namespace {

constexpr std::chrono::milliseconds POLL_TICK{50};

class PosixChildProcess : public ChildProcess {
public:
    PosixChildProcess(pid_t pid, int stdout_fd, int stderr_fd)
        : pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

    ~PosixChildProcess() override {
        if (!exited_) {
            kill();
            int status;
            if (waitpid(pid_, &status, 0) == pid_) {
                record_status(status);
            }
        }
        close_fd(stdout_fd_);
        close_fd(stderr_fd_);
    }

    bool wait_for(std::chrono::milliseconds timeout) override {
        auto deadline = std::chrono::steady_clock::now() + timeout;

        while (true) {
            reap(false);

            if (exited_) {
                // A grandchild may still hold the pipes open; take what is
                // buffered and stop listening.
                drain(stdout_fd_, stdout_);
                drain(stderr_fd_, stderr_);
                close_fd(stdout_fd_);
                close_fd(stderr_fd_);
                return true;
            }

            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return false;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            int tick = static_cast<int>(std::min(remaining, POLL_TICK).count());

            struct pollfd fds[2];
            nfds_t nfds = 0;
            if (stdout_fd_ >= 0) fds[nfds++] = {stdout_fd_, POLLIN, 0};
            if (stderr_fd_ >= 0) fds[nfds++] = {stderr_fd_, POLLIN, 0};

            int ready = poll(nfds > 0 ? fds : nullptr, nfds, std::max(tick, 1));
            if (ready < 0 && errno != EINTR) {
                // Pipes unusable; fall back to sleeping until the child is reaped
                close_fd(stdout_fd_);
                close_fd(stderr_fd_);
                continue;
            }

            for (nfds_t i = 0; i < nfds && ready > 0; ++i) {
                if (fds[i].revents == 0) continue;
                if (fds[i].fd == stdout_fd_) {
                    drain(stdout_fd_, stdout_);
                } else if (fds[i].fd == stderr_fd_) {
                    drain(stderr_fd_, stderr_);
                }
            }
        }
    }

    int exit_code() const override { return exit_code_; }

    void kill() override {
        if (exited_) return;
        // The child leads its own process group: take the whole tree down
        if (::kill(-pid_, SIGKILL) != 0) {
            ::kill(pid_, SIGKILL);
        }
    }

    bool is_running() override {
        reap(false);
        return !exited_;
    }

    long pid() const override { return static_cast<long>(pid_); }

    const std::string& stdout_text() const override { return stdout_; }
    const std::string& stderr_text() const override { return stderr_; }

private:
    void reap(bool block) {
        if (exited_) return;
        int status;
        pid_t result = waitpid(pid_, &status, block ? 0 : WNOHANG);
        if (result == pid_) {
            record_status(status);
        } else if (result < 0 && errno == ECHILD) {
            // Reaped elsewhere; nothing left to wait for
            exited_ = true;
            exit_code_ = -1;
        }
    }

    void record_status(int status) {
        exited_ = true;
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = -WTERMSIG(status);
        }
    }

    // Read everything currently available; closes fd on EOF
    static void drain(int& fd, std::string& out) {
        if (fd < 0) return;
        char buffer[PIPE_BUFFER_SIZE];
        while (true) {
            ssize_t n = read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                out.append(buffer, static_cast<size_t>(n));
            } else if (n == 0) {
                close_fd(fd);
                return;
            } else if (errno == EINTR) {
                continue;
            } else {
                if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    close_fd(fd);
                }
                return;
            }
        }
    }

    static void close_fd(int& fd) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }

    pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;
    bool exited_ = false;
    int exit_code_ = -1;
    std::string stdout_;
    std::string stderr_;
};

// posix_spawn attribute/action objects released on every path
struct SpawnSetup {
    posix_spawnattr_t attr;
    posix_spawn_file_actions_t actions;

    SpawnSetup() {
        posix_spawnattr_init(&attr);
        posix_spawn_file_actions_init(&actions);
    }
    ~SpawnSetup() {
        posix_spawn_file_actions_destroy(&actions);
        posix_spawnattr_destroy(&attr);
    }
};

class PosixProcessLauncher : public ProcessLauncher {
public:
    std::unique_ptr<ChildProcess> launch(const std::vector<std::string>& argv) override {
        if (argv.empty()) {
            throw LaunchError("Empty command");
        }

        // O_CLOEXEC keeps these pipes out of children spawned concurrently
        // by other jobs; dup2 onto 1/2 clears the flag for our own child.
        int stdout_pipe[2], stderr_pipe[2];
        if (pipe2(stdout_pipe, O_CLOEXEC) == -1) {
            throw LaunchError(std::string("Failed to create pipes: ") + std::strerror(errno));
        }
        if (pipe2(stderr_pipe, O_CLOEXEC) == -1) {
            int saved = errno;
            close(stdout_pipe[0]);
            close(stdout_pipe[1]);
            throw LaunchError(std::string("Failed to create pipes: ") + std::strerror(saved));
        }

        SpawnSetup setup;
        posix_spawnattr_setflags(&setup.attr, POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETPGROUP);
        posix_spawnattr_setpgroup(&setup.attr, 0);  // new process group

        sigset_t default_signals;
        sigemptyset(&default_signals);
        sigaddset(&default_signals, SIGPIPE);
        sigaddset(&default_signals, SIGTERM);
        posix_spawnattr_setsigdefault(&setup.attr, &default_signals);

        posix_spawn_file_actions_addopen(&setup.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        posix_spawn_file_actions_adddup2(&setup.actions, stdout_pipe[1], STDOUT_FILENO);
        posix_spawn_file_actions_adddup2(&setup.actions, stderr_pipe[1], STDERR_FILENO);

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            args.push_back(const_cast<char*>(arg.c_str()));
        }
        args.push_back(nullptr);

        pid_t pid = -1;
        int spawn_ret = posix_spawnp(&pid, args[0], &setup.actions, &setup.attr,
                                     args.data(), environ);

        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (spawn_ret != 0) {
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            throw LaunchError("Failed to launch " + argv[0] + ": " + std::strerror(spawn_ret));
        }

        fcntl(stdout_pipe[0], F_SETFL, fcntl(stdout_pipe[0], F_GETFL) | O_NONBLOCK);
        fcntl(stderr_pipe[0], F_SETFL, fcntl(stderr_pipe[0], F_GETFL) | O_NONBLOCK);

        return std::make_unique<PosixChildProcess>(pid, stdout_pipe[0], stderr_pipe[0]);
    }
};

} // namespace

std::unique_ptr<ProcessLauncher> make_native_launcher() {
    return std::make_unique<PosixProcessLauncher>();
}

} // namespace tabrun
