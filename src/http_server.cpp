#include "http_server.h"
#include "constants.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <json/json.h>

namespace tabrun {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string json_body(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

void write_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = write(fd, data.data() + sent, data.size() - sent);
        if (n <= 0) {
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    std::string wanted = to_lower(name);
    for (const auto& [key, value] : headers) {
        if (to_lower(key) == wanted) {
            return value;
        }
    }
    return "";
}

std::string HttpRequest::query_param(const std::string& name, const std::string& fallback) const {
    auto it = query.find(name);
    return it != query.end() ? it->second : fallback;
}

HttpResponse HttpResponse::error(int status_code, const std::string& message) {
    HttpResponse resp;
    resp.status_code = status_code;
    Json::Value body;
    body["error"] = message;
    resp.body = json_body(body);
    return resp;
}

HttpServer::HttpServer(int port) : port_(port), server_fd_(-1), running_(false) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = std::move(handler);
}

void HttpServer::start() {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr {};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(static_cast<uint16_t>(port_.load()));

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        throw std::runtime_error("Failed to bind to port " + std::to_string(port_.load()));
    }

    if (listen(fd, LISTEN_BACKLOG) < 0) {
        close(fd);
        throw std::runtime_error("Failed to listen");
    }

    socklen_t addr_len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &addr_len) == 0) {
        port_ = ntohs(addr.sin_port);
    }

    server_fd_ = fd;
    running_ = true;
    std::cout << "[Server] Listening on port " << port_.load() << std::endl;

    while (running_) {
        struct sockaddr_in client_addr {};
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(server_fd_.load(), reinterpret_cast<struct sockaddr*>(&client_addr),
                               &client_len);
        if (client_fd < 0) {
            if (running_) continue;
            break;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string client_ip = ip;

        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            open_clients_.insert(client_fd);
        }
        try {
            std::thread([this, client_fd, client_ip]() {
                handle_client(client_fd, client_ip);
                finish_connection(client_fd);
            }).detach();
        } catch (const std::system_error& e) {
            std::cerr << "[Server] Cannot start connection thread: " << e.what() << std::endl;
            finish_connection(client_fd);
        }
    }

    drain_connections();
}

void HttpServer::stop() {
    running_ = false;
    int fd = server_fd_.exchange(-1);
    if (fd >= 0) {
        shutdown(fd, SHUT_RDWR);
        close(fd);
    }
}

size_t HttpServer::open_connections() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return open_clients_.size();
}

void HttpServer::finish_connection(int client_fd) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    close(client_fd);
    open_clients_.erase(client_fd);
    connections_done_.notify_all();
}

void HttpServer::drain_connections() {
    std::unique_lock<std::mutex> lock(connections_mutex_);
    if (!open_clients_.empty()) {
        std::cout << "[Server] Waiting for " << open_clients_.size()
                  << " open connection(s)" << std::endl;
    }
    // Idle clients see EOF; handlers already running still write their response
    for (int fd : open_clients_) {
        shutdown(fd, SHUT_RD);
    }
    connections_done_.wait(lock, [this] { return open_clients_.empty(); });
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    std::string request_data;
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    ssize_t bytes_read;
    size_t expected_size = 0;
    bool have_headers = false;
    const std::string too_large = build_response(HttpResponse::error(
        413, "Request exceeds " + std::to_string(MAX_REQUEST_SIZE / (1024 * 1024)) + "MB limit"));

    // Headers first, then exactly Content-Length body bytes
    while ((bytes_read = read(client_fd, buffer, sizeof(buffer))) > 0) {
        request_data.append(buffer, static_cast<size_t>(bytes_read));
        if (request_data.size() > MAX_REQUEST_SIZE) {
            write_all(client_fd, too_large);
            return;
        }

        size_t header_end = request_data.find("\r\n\r\n");
        if (header_end == std::string::npos) {
            continue;
        }

        HttpRequest head = parse_request(request_data.substr(0, header_end + 4));
        std::string length_text = head.header("Content-Length");
        size_t content_length = 0;
        if (!length_text.empty()) {
            try {
                content_length = std::stoul(length_text);
            } catch (const std::exception&) {
                write_all(client_fd, build_response(HttpResponse::error(400, "Bad Content-Length")));
                return;
            }
        }

        expected_size = header_end + 4 + content_length;
        if (expected_size > MAX_REQUEST_SIZE) {
            write_all(client_fd, too_large);
            return;
        }
        have_headers = true;
        break;
    }

    while (request_data.size() < expected_size) {
        bytes_read = read(client_fd, buffer,
                          std::min(sizeof(buffer), expected_size - request_data.size()));
        if (bytes_read <= 0) break;
        request_data.append(buffer, static_cast<size_t>(bytes_read));
    }

    // Client went away (or the server is draining) mid-request
    if (!have_headers || request_data.size() < expected_size) return;

    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;

    HttpResponse resp = handle(req);
    write_all(client_fd, build_response(resp));
}

HttpResponse HttpServer::handle(const HttpRequest& req) const {
    const HandlerFunc* handler = nullptr;

    auto exact = routes_.find(req.method + " " + req.path);
    if (exact != routes_.end()) {
        handler = &exact->second;
    } else {
        size_t best_length = 0;
        for (const auto& [pattern, candidate] : routes_) {
            size_t space_pos = pattern.find(' ');
            std::string method = pattern.substr(0, space_pos);
            std::string prefix = pattern.substr(space_pos + 1);

            if (method == req.method && prefix.size() > 1 && prefix.back() == '/' &&
                req.path.compare(0, prefix.size(), prefix) == 0 &&
                prefix.size() > best_length) {
                handler = &candidate;
                best_length = prefix.size();
            }
        }
    }

    if (!handler) {
        return HttpResponse::error(404, "Not found");
    }

    try {
        return (*handler)(req);
    } catch (const std::exception& e) {
        std::cerr << "[Server] " << req.method << " " << req.path << " failed: "
                  << e.what() << std::endl;
        return HttpResponse::error(500, e.what());
    }
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t header_end = raw.find("\r\n\r\n");
    std::string head = raw.substr(0, header_end);
    if (header_end != std::string::npos) {
        req.body = raw.substr(header_end + 4);
    }

    std::istringstream stream(head);
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);
    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        std::string target = line.substr(space1 + 1, space2 - space1 - 1);

        size_t question = target.find('?');
        req.path = url_decode(target.substr(0, question));
        if (question != std::string::npos) {
            std::istringstream query(target.substr(question + 1));
            std::string pair;
            while (std::getline(query, pair, '&')) {
                if (pair.empty()) continue;
                size_t eq = pair.find('=');
                std::string key = url_decode(pair.substr(0, eq));
                std::string value = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
                req.query[key] = value;
            }
        }
    }

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = line.substr(0, colon);
            size_t value_start = line.find_first_not_of(' ', colon + 1);
            req.headers[key] = value_start == std::string::npos ? "" : line.substr(value_start);
        }
    }

    return req;
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    out << "HTTP/1.1 " << resp.status_code << " " << status_text(resp.status_code) << "\r\n";
    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }
    out << "Content-Length: " << resp.body.size() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";
    out << resp.body;

    return out.str();
}

std::string HttpServer::url_decode(const std::string& text) {
    std::string decoded;
    decoded.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size() &&
            std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            decoded += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else if (text[i] == '+') {
            decoded += ' ';
        } else {
            decoded += text[i];
        }
    }
    return decoded;
}

std::string HttpServer::status_text(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        default: return "Unknown";
    }
}

} // namespace tabrun
