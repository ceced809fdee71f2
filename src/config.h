#pragma once

#include "constants.h"
#include "sandbox.h"
#include "retention_sweeper.h"
#include <chrono>
#include <set>
#include <string>

namespace tabrun {

// Runtime configuration: compiled defaults from constants.h, overridden
// from the command line.
struct ServiceConfig {
    int port = DEFAULT_PORT;
    std::string data_dir;                            // Root of uploads/, code/, results/
    std::set<std::string> allowed_extensions = {"csv", "xls", "xlsx"};
    size_t max_upload_bytes = MAX_UPLOAD_SIZE;
    std::chrono::seconds timeout = std::chrono::seconds(DEFAULT_TIMEOUT_SECONDS);
    SandboxConfig sandbox;
    RetentionSweeper::Config sweeper;

    ServiceConfig();

    std::string upload_dir() const;
    std::string code_dir() const;
    std::string results_dir() const;

    // mkdir -p for the three artifact directories
    void create_directories() const;

    // Throws std::invalid_argument on unknown flags or bad values
    static ServiceConfig from_args(int argc, char* argv[]);

    static std::string usage(const std::string& program);
};

} // namespace tabrun
