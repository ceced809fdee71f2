/*
 * Tabrun - Sandboxed Tabular Job Execution
 * Upload a spreadsheet, submit processing code, fetch the results
 */

#include "config.h"
#include "file_utils.h"
#include "http_server.h"
#include "job_coordinator.h"
#include "job_id.h"
#include "job_registry.h"
#include "multipart.h"
#include "process_launcher.h"
#include "retention_sweeper.h"
#include "sandbox.h"
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <json/json.h>

using namespace tabrun;

namespace {

HttpServer* active_server = nullptr;

void handle_signal(int) {
    if (active_server) {
        active_server->stop();
    }
}

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

HttpResponse json_response(const Json::Value& value, int status_code = 200) {
    HttpResponse resp;
    resp.status_code = status_code;
    resp.body = write_json(value);
    return resp;
}

bool parse_json(const std::string& text, Json::Value& out, std::string& errors) {
    Json::CharReaderBuilder reader;
    std::unique_ptr<Json::CharReader> parser(reader.newCharReader());
    return parser->parse(text.data(), text.data() + text.size(), &out, &errors);
}

// "/status/<id>" -> "<id>", empty unless the remainder is a well-formed job id
std::string path_id(const HttpRequest& req, const std::string& prefix) {
    std::string id = req.path.substr(prefix.size());
    return is_valid_job_id(id) ? id : "";
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot read " + path);
    }
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

int status_for(Outcome outcome) {
    switch (outcome) {
        case Outcome::OK: return 200;
        case Outcome::REJECTED: return 400;
        case Outcome::NOT_READY: return 400;
        case Outcome::NOT_FOUND: return 404;
        case Outcome::CONFLICT: return 409;
    }
    return 500;
}

void register_routes(HttpServer& server, JobCoordinator& coordinator, const ServiceConfig& config) {
    // POST /upload - multipart field "file"
    server.route("POST", "/upload", [&coordinator](const HttpRequest& req) {
        auto parts = MultipartParser::parse(req.header("Content-Type"), req.body);
        const MultipartPart* file = MultipartParser::find(parts, "file");
        if (!file || file->filename.empty()) {
            return HttpResponse::error(400, "No file selected");
        }

        std::string job_id;
        try {
            job_id = coordinator.upload_file(file->filename, file->data);
        } catch (const ValidationError& e) {
            return HttpResponse::error(400, e.what());
        }

        Json::Value body;
        body["job_id"] = job_id;
        body["status"] = status_to_string(JobStatus::UPLOADED);
        body["message"] = "File uploaded successfully";
        return json_response(body);
    });

    // POST /submit_code/{id} - JSON {"code": "..."}
    server.route("POST", "/submit_code/", [&coordinator](const HttpRequest& req) {
        std::string job_id = path_id(req, "/submit_code/");
        if (job_id.empty()) {
            return HttpResponse::error(404, "Job not found");
        }

        Json::Value payload;
        std::string errors;
        if (!parse_json(req.body, payload, errors) || !payload.isObject()) {
            return HttpResponse::error(400, "Invalid JSON body");
        }
        if (!payload["code"].isString()) {
            return HttpResponse::error(400, "No code provided");
        }

        SubmitResult result = coordinator.submit_code(job_id, payload["code"].asString());
        if (result.outcome != Outcome::OK) {
            return HttpResponse::error(status_for(result.outcome), result.reason);
        }

        Json::Value body;
        body["job_id"] = job_id;
        body["status"] = status_to_string(JobStatus::PROCESSING);
        body["message"] = "Code submitted for processing";
        return json_response(body);
    });

    // GET /status/{id}
    server.route("GET", "/status/", [&coordinator](const HttpRequest& req) {
        auto record = coordinator.get_status(path_id(req, "/status/"));
        if (!record) {
            return HttpResponse::error(404, "Job not found");
        }
        return json_response(to_json(*record));
    });

    // GET /results/{id}?output_format=json|csv|excel
    server.route("GET", "/results/", [&coordinator](const HttpRequest& req) {
        std::string job_id = path_id(req, "/results/");
        ResultFile result = coordinator.get_result(job_id, req.query_param("output_format", "json"));
        if (result.outcome != Outcome::OK) {
            return HttpResponse::error(status_for(result.outcome), result.reason);
        }

        std::string content = read_file(result.path);

        HttpResponse resp;
        resp.headers["X-Content-SHA256"] = result.metadata.sha256_hash;

        if (result.metadata.type == FileType::JSON) {
            Json::Value parsed;
            std::string errors;
            if (parse_json(content, parsed, errors)) {
                resp.body = write_json(parsed);
                return resp;
            }
            std::cerr << "[Server] Result " << result.path << " is not valid JSON, sending raw"
                      << std::endl;
        }

        resp.headers["Content-Type"] = result.mime_type;
        resp.headers["Content-Disposition"] = "attachment; filename=\"" + result.download_name + "\"";
        resp.body = std::move(content);
        return resp;
    });

    // DELETE /cleanup/{id}
    server.route("DELETE", "/cleanup/", [&coordinator](const HttpRequest& req) {
        std::string job_id = path_id(req, "/cleanup/");
        if (coordinator.delete_job(job_id) != Outcome::OK) {
            return HttpResponse::error(404, "Job not found");
        }
        Json::Value body;
        body["message"] = "Job " + job_id + " cleaned up successfully";
        return json_response(body);
    });

    // GET /template
    server.route("GET", "/template", [](const HttpRequest&) {
        Json::Value body;
        body["template"] = JobCoordinator::get_template();
        return json_response(body);
    });

    // GET / - Basic info
    server.route("GET", "/", [&config](const HttpRequest&) {
        Json::Value body;
        body["service"] = "tabrun";
        body["status"] = "running";
        body["timeout_seconds"] = static_cast<Json::Int64>(config.timeout.count());
        body["max_upload_bytes"] = static_cast<Json::UInt64>(config.max_upload_bytes);
        Json::Value formats(Json::arrayValue);
        for (const auto& ext : config.allowed_extensions) {
            formats.append(ext);
        }
        body["formats"] = formats;
        return json_response(body);
    });
}

} // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            std::cout << ServiceConfig::usage(argv[0]);
            return 0;
        }
    }

    ServiceConfig config;
    try {
        config = ServiceConfig::from_args(argc, argv);
        config.create_directories();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << ServiceConfig::usage(argv[0]);
        return 1;
    }

    std::cout << "Tabrun - Sandboxed Tabular Job Execution" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;
    std::cout << "Data dir: " << config.data_dir << std::endl;
    std::cout << "Runtime:  " << config.sandbox.runtime << " (image " << config.sandbox.image << ")"
              << std::endl;
    std::cout << "Timeout:  " << config.timeout.count() << "s" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    JobRegistry registry;
    auto launcher = make_native_launcher();
    SandboxExecutor executor(registry, *launcher, config.sandbox);
    RetentionSweeper sweeper(registry, config.sweeper);

    int exit_code = 0;
    {
        JobCoordinator coordinator(registry, executor, config);
        HttpServer server(config.port);
        register_routes(server, coordinator, config);

        active_server = &server;
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        sweeper.start();

        std::cout << "API endpoints:" << std::endl;
        std::cout << "  POST   /upload             - Upload csv/xls/xlsx" << std::endl;
        std::cout << "  POST   /submit_code/{id}   - Submit processing code" << std::endl;
        std::cout << "  GET    /status/{id}        - Check status" << std::endl;
        std::cout << "  GET    /results/{id}       - Download results" << std::endl;
        std::cout << "  DELETE /cleanup/{id}       - Delete job and files" << std::endl;
        std::cout << "  GET    /template           - Example code" << std::endl;
        std::cout << std::endl;

        try {
            server.start();
        } catch (const std::exception& e) {
            std::cerr << "[Server] " << e.what() << std::endl;
            exit_code = 1;
        }

        // start() returned only after every handler finished
        active_server = nullptr;
        std::cout << "[Server] Shutting down" << std::endl;
        coordinator.begin_shutdown();
        sweeper.stop();
    }

    return exit_code;
}
