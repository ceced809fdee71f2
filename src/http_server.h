#pragma once

#include <string>
#include <functional>
#include <map>
#include <set>
#include <atomic>
#include <condition_variable>
#include <mutex>

namespace tabrun {

// Parsed HTTP request. path excludes the query string.
struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string client_ip;

    // Case-insensitive header lookup, empty if absent
    std::string header(const std::string& name) const;

    std::string query_param(const std::string& name, const std::string& fallback = "") const;
};

struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
        headers["Access-Control-Allow-Origin"] = "*";
    }

    // JSON body {"error": message}
    static HttpResponse error(int status_code, const std::string& message);
};

using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Minimal blocking HTTP/1.1 server, one thread per connection.
//
// Routes are matched exactly first, then by the longest registered prefix,
// so "/status/" also serves "/status/<id>".
//
// start() does not return while a connection thread is alive: after stop()
// it stops reading from open connections, lets handlers already running
// finish and write their response, then returns. Whatever the handlers use
// only has to outlive start().
class HttpServer {
public:
    explicit HttpServer(int port);
    ~HttpServer();

    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Blocks until stop() and every open connection is done
    void start();

    // Safe to call from a signal handler
    void stop();

    // Bound port once listening (resolves port 0), else the configured one
    int port() const { return port_.load(); }

    size_t open_connections() const;

    // Dispatch one parsed request through the route table
    HttpResponse handle(const HttpRequest& req) const;

    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static std::string url_decode(const std::string& text);
    static std::string status_text(int status_code);

private:
    std::atomic<int> port_;
    std::atomic<int> server_fd_;
    std::atomic<bool> running_;
    std::map<std::string, HandlerFunc> routes_;

    mutable std::mutex connections_mutex_;
    std::condition_variable connections_done_;
    std::set<int> open_clients_;

    void handle_client(int client_fd, const std::string& client_ip);
    void finish_connection(int client_fd);
    void drain_connections();
};

} // namespace tabrun
