#pragma once

#include <string>
#include <functional>
#include <map>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace sandpool {

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;                                // Without the query string
    std::string query;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string client_ip;

    // Case-insensitive header lookup; empty if absent
    std::string header(const std::string& name) const;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
        headers["Access-Control-Allow-Origin"] = "*";
    }
};

// Request handler function type
using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Minimal HTTP/1.1 server, one thread per connection, one request per
// connection. Routes match exactly first, then by longest path prefix
// (e.g. "/result/" serves "/result/{id}").
class HttpServer {
public:
    explicit HttpServer(int port = 5000);
    ~HttpServer();

    // Register route handlers
    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Start server (blocks until stop())
    void start();

    // Stop server; safe to call from another thread or a signal handler
    void stop();

    // Wait until no connection thread is running; false on timeout.
    // Call after start() returns, before tearing down what handlers use.
    bool drain(std::chrono::milliseconds timeout);
    size_t active_connections() const;

    // Port actually bound (differs from the requested one when that was 0)
    int port() const { return bound_port_.load(); }
    bool is_running() const { return running_.load(); }

    // Dispatch a parsed request to its handler; unknown routes give 404
    HttpResponse dispatch(const HttpRequest& req) const;

    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static std::string status_text(int status_code);

private:
    int port_;
    std::atomic<int> bound_port_{0};
    std::atomic<int> server_fd_{-1};
    std::atomic<bool> running_{false};
    std::map<std::string, HandlerFunc> routes_;

    mutable std::mutex connections_mutex_;
    std::condition_variable connections_cv_;
    size_t active_connections_ = 0;

    void handle_client(int client_fd, const std::string& client_ip);
};

} // namespace sandpool
