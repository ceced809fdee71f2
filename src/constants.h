#pragma once

#include <cstddef>  // for size_t

namespace tabrun {

// Upload limits
constexpr size_t MAX_UPLOAD_SIZE = 50 * 1024 * 1024;              // 50MB per data file
constexpr size_t MAX_REQUEST_SIZE = 64 * 1024 * 1024;             // 64MB max request

// Container limits
constexpr size_t DEFAULT_MEMORY_LIMIT_MB = 512;                   // --memory
constexpr int DEFAULT_CPU_SHARES = 512;                           // --cpu-shares weight

// Time limits
constexpr int DEFAULT_TIMEOUT_SECONDS = 120;                      // Wall clock per job
constexpr int KILL_GRACE_SECONDS = 5;                             // Wait for exit after kill
constexpr int RETENTION_HOURS = 24;                               // Purge jobs older than this
constexpr int SWEEP_INTERVAL_SECONDS = 3600;                      // Sweeper cycle

// Registry
constexpr size_t REGISTRY_SHARDS = 16;

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                         // Read buffer size
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                      // Initial HTTP buffer

// Network
constexpr int DEFAULT_PORT = 8000;                                // Default server port
constexpr int LISTEN_BACKLOG = 10;                                // Socket listen backlog

// In-container layout
constexpr const char* CONTAINER_INPUT_STEM = "/data/input_file";
constexpr const char* CONTAINER_CODE_PATH = "/data/process.py";
constexpr const char* CONTAINER_OUTPUT_DIR = "/data/output";

} // namespace tabrun
