#include "config.h"
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace tabrun {

namespace {

long parse_positive(const std::string& flag, const std::string& value) {
    size_t used = 0;
    long parsed = 0;
    try {
        parsed = std::stol(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    if (used != value.size() || parsed <= 0) {
        throw std::invalid_argument(flag + " expects a positive number, got '" + value + "'");
    }
    return parsed;
}

} // namespace

ServiceConfig::ServiceConfig()
    : data_dir((fs::temp_directory_path() / "tabrun").string()) {}

std::string ServiceConfig::upload_dir() const {
    return (fs::path(data_dir) / "uploads").string();
}

std::string ServiceConfig::code_dir() const {
    return (fs::path(data_dir) / "code").string();
}

std::string ServiceConfig::results_dir() const {
    return (fs::path(data_dir) / "results").string();
}

void ServiceConfig::create_directories() const {
    fs::create_directories(upload_dir());
    fs::create_directories(code_dir());
    fs::create_directories(results_dir());
}

ServiceConfig ServiceConfig::from_args(int argc, char* argv[]) {
    ServiceConfig config;

    for (int i = 1; i < argc; i++) {
        std::string flag = argv[i];
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + flag);
        }
        std::string value = argv[++i];

        if (flag == "--port") {
            long port = parse_positive(flag, value);
            if (port > 65535) {
                throw std::invalid_argument("--port out of range: " + value);
            }
            config.port = static_cast<int>(port);
        } else if (flag == "--data-dir") {
            config.data_dir = value;
        } else if (flag == "--timeout") {
            config.timeout = std::chrono::seconds(parse_positive(flag, value));
        } else if (flag == "--retention-hours") {
            config.sweeper.retention = std::chrono::hours(parse_positive(flag, value));
        } else if (flag == "--sweep-interval") {
            config.sweeper.interval = std::chrono::seconds(parse_positive(flag, value));
        } else if (flag == "--runtime") {
            config.sandbox.runtime = value;
        } else if (flag == "--image") {
            config.sandbox.image = value;
        } else if (flag == "--memory-mb") {
            config.sandbox.memory_limit_mb = static_cast<size_t>(parse_positive(flag, value));
        } else if (flag == "--cpu-shares") {
            config.sandbox.cpu_shares = static_cast<int>(parse_positive(flag, value));
        } else if (flag == "--max-upload-mb") {
            config.max_upload_bytes = static_cast<size_t>(parse_positive(flag, value)) * 1024 * 1024;
        } else {
            throw std::invalid_argument("Unknown option: " + flag);
        }
    }

    return config;
}

std::string ServiceConfig::usage(const std::string& program) {
    ServiceConfig defaults;
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --port N              Listen port (default " << defaults.port << ")\n"
        << "  --data-dir PATH       Artifact root (default " << defaults.data_dir << ")\n"
        << "  --timeout SEC         Wall clock limit per job (default " << defaults.timeout.count() << ")\n"
        << "  --retention-hours H   Purge jobs older than H hours (default "
        << std::chrono::duration_cast<std::chrono::hours>(defaults.sweeper.retention).count() << ")\n"
        << "  --sweep-interval SEC  Sweeper period (default " << defaults.sweeper.interval.count() << ")\n"
        << "  --runtime BIN         Container runtime CLI (default " << defaults.sandbox.runtime << ")\n"
        << "  --image NAME          Sandbox image (default " << defaults.sandbox.image << ")\n"
        << "  --memory-mb N         Container memory limit (default " << defaults.sandbox.memory_limit_mb << ")\n"
        << "  --cpu-shares N        Container CPU weight (default " << defaults.sandbox.cpu_shares << ")\n"
        << "  --max-upload-mb N     Upload size limit (default " << defaults.max_upload_bytes / (1024 * 1024) << ")\n";
    return out.str();
}

} // namespace tabrun
