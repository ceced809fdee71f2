#include "process_launcher.h"
#include "constants.h"

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

#include <mutex>
#include <thread>
#include <vector>

namespace tabrun {

namespace {

std::string last_error_message() {
    DWORD code = GetLastError();
    char* text = nullptr;
    FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM |
                   FORMAT_MESSAGE_IGNORE_INSERTS,
                   nullptr, code, 0, reinterpret_cast<LPSTR>(&text), 0, nullptr);
    std::string message = text ? text : ("error " + std::to_string(code));
    if (text) LocalFree(text);
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    return message;
}

// Quote one argument following the MSVCRT command line rules
std::string quote_argument(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) {
        return arg;
    }
    std::string quoted = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
        } else if (c == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
            quoted += '"';
            backslashes = 0;
        } else {
            quoted.append(backslashes, '\\');
            quoted += c;
            backslashes = 0;
        }
    }
    quoted.append(backslashes * 2, '\\');
    quoted += '"';
    return quoted;
}

class Win32ChildProcess : public ChildProcess {
public:
    Win32ChildProcess(HANDLE process, HANDLE job, DWORD pid, HANDLE stdout_read, HANDLE stderr_read)
        : process_(process), job_(job), pid_(pid) {
        // Anonymous pipes cannot be polled; one reader thread per stream
        stdout_reader_ = std::thread([this, stdout_read]() { pump(stdout_read, stdout_); });
        stderr_reader_ = std::thread([this, stderr_read]() { pump(stderr_read, stderr_); });
    }

    ~Win32ChildProcess() override {
        if (is_running()) {
            kill();
            WaitForSingleObject(process_, INFINITE);
        }
        join_readers();
        CloseHandle(process_);
        if (job_) CloseHandle(job_);
    }

    bool wait_for(std::chrono::milliseconds timeout) override {
        DWORD wait = WaitForSingleObject(process_, static_cast<DWORD>(timeout.count()));
        if (wait != WAIT_OBJECT_0) {
            return false;
        }
        DWORD code = 0;
        GetExitCodeProcess(process_, &code);
        exit_code_ = static_cast<int>(code);
        // Killing the job closes every handle to the pipes, so readers finish
        join_readers();
        return true;
    }

    int exit_code() const override { return exit_code_; }

    void kill() override {
        // The job object holds the whole tree spawned by the runtime client
        if (job_) {
            TerminateJobObject(job_, 1);
        } else {
            TerminateProcess(process_, 1);
        }
    }

    bool is_running() override {
        return WaitForSingleObject(process_, 0) == WAIT_TIMEOUT;
    }

    long pid() const override { return static_cast<long>(pid_); }

    const std::string& stdout_text() const override { return stdout_; }
    const std::string& stderr_text() const override { return stderr_; }

private:
    void pump(HANDLE pipe, std::string& out) {
        char buffer[PIPE_BUFFER_SIZE];
        DWORD n = 0;
        while (ReadFile(pipe, buffer, sizeof(buffer), &n, nullptr) && n > 0) {
            std::lock_guard<std::mutex> lock(output_mutex_);
            out.append(buffer, n);
        }
        CloseHandle(pipe);
    }

    void join_readers() {
        if (stdout_reader_.joinable()) stdout_reader_.join();
        if (stderr_reader_.joinable()) stderr_reader_.join();
    }

    HANDLE process_;
    HANDLE job_;
    DWORD pid_;
    int exit_code_ = -1;
    std::mutex output_mutex_;
    std::string stdout_;
    std::string stderr_;
    std::thread stdout_reader_;
    std::thread stderr_reader_;
};

class Win32ProcessLauncher : public ProcessLauncher {
public:
    std::unique_ptr<ChildProcess> launch(const std::vector<std::string>& argv) override {
        if (argv.empty()) {
            throw LaunchError("Empty command");
        }

        SECURITY_ATTRIBUTES sa{};
        sa.nLength = sizeof(sa);
        sa.bInheritHandle = TRUE;

        HANDLE stdout_read = nullptr, stdout_write = nullptr;
        HANDLE stderr_read = nullptr, stderr_write = nullptr;
        if (!CreatePipe(&stdout_read, &stdout_write, &sa, 0)) {
            throw LaunchError("Failed to create pipes: " + last_error_message());
        }
        if (!CreatePipe(&stderr_read, &stderr_write, &sa, 0)) {
            std::string message = last_error_message();
            CloseHandle(stdout_read);
            CloseHandle(stdout_write);
            throw LaunchError("Failed to create pipes: " + message);
        }
        // Only the write ends go to the child
        SetHandleInformation(stdout_read, HANDLE_FLAG_INHERIT, 0);
        SetHandleInformation(stderr_read, HANDLE_FLAG_INHERIT, 0);

        HANDLE null_input = CreateFileA("NUL", GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE,
                                        &sa, OPEN_EXISTING, 0, nullptr);

        // The handles are inheritable, so a launch on another thread could
        // pick them up and hold this child's pipes open. The child inherits
        // exactly this list and nothing else.
        std::vector<HANDLE> inherited = {stdout_write, stderr_write};
        if (null_input != INVALID_HANDLE_VALUE) {
            inherited.push_back(null_input);
        }

        SIZE_T attr_size = 0;
        InitializeProcThreadAttributeList(nullptr, 1, 0, &attr_size);
        std::vector<char> attr_buffer(attr_size);
        auto attrs = reinterpret_cast<LPPROC_THREAD_ATTRIBUTE_LIST>(attr_buffer.data());
        bool attrs_initialized = InitializeProcThreadAttributeList(attrs, 1, 0, &attr_size) != FALSE;
        bool attrs_ready = attrs_initialized &&
            UpdateProcThreadAttribute(attrs, 0, PROC_THREAD_ATTRIBUTE_HANDLE_LIST, inherited.data(),
                                      inherited.size() * sizeof(HANDLE), nullptr, nullptr) != FALSE;

        STARTUPINFOEXA si{};
        si.StartupInfo.cb = sizeof(si);
        si.StartupInfo.dwFlags = STARTF_USESTDHANDLES;
        si.StartupInfo.hStdInput = null_input != INVALID_HANDLE_VALUE ? null_input : nullptr;
        si.StartupInfo.hStdOutput = stdout_write;
        si.StartupInfo.hStdError = stderr_write;
        si.lpAttributeList = attrs;

        std::string command_line;
        for (const auto& arg : argv) {
            if (!command_line.empty()) command_line += ' ';
            command_line += quote_argument(arg);
        }

        HANDLE job = CreateJobObjectA(nullptr, nullptr);
        if (job) {
            JOBOBJECT_EXTENDED_LIMIT_INFORMATION info{};
            info.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
            SetInformationJobObject(job, JobObjectExtendedLimitInformation, &info, sizeof(info));
        }

        PROCESS_INFORMATION pi{};
        BOOL created = FALSE;
        std::string create_error;
        if (attrs_ready) {
            created = CreateProcessA(nullptr, command_line.data(), nullptr, nullptr, TRUE,
                                     CREATE_NO_WINDOW | CREATE_SUSPENDED |
                                         EXTENDED_STARTUPINFO_PRESENT,
                                     nullptr, nullptr, &si.StartupInfo, &pi);
            if (!created) create_error = last_error_message();
        } else {
            create_error = "cannot restrict inherited handles: " + last_error_message();
        }
        if (attrs_initialized) {
            DeleteProcThreadAttributeList(attrs);
        }

        CloseHandle(stdout_write);
        CloseHandle(stderr_write);
        if (null_input != INVALID_HANDLE_VALUE) CloseHandle(null_input);

        if (!created) {
            CloseHandle(stdout_read);
            CloseHandle(stderr_read);
            if (job) CloseHandle(job);
            throw LaunchError("Failed to launch " + argv[0] + ": " + create_error);
        }

        if (job && !AssignProcessToJobObject(job, pi.hProcess)) {
            CloseHandle(job);
            job = nullptr;
        }
        ResumeThread(pi.hThread);
        CloseHandle(pi.hThread);

        return std::make_unique<Win32ChildProcess>(pi.hProcess, job, pi.dwProcessId,
                                                   stdout_read, stderr_read);
    }
};

} // namespace

std::unique_ptr<ProcessLauncher> make_native_launcher() {
    return std::make_unique<Win32ProcessLauncher>();
}

} // namespace tabrun
