#include "http_server.h"
#include "constants.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <json/json.h>

namespace sandpool {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::string error_body(const std::string& message) {
    Json::Value body;
    body["error"] = message;
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, body);
}

void write_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;  // Client went away
        }
        sent += static_cast<size_t>(n);
    }
}

// Content-Length from a raw header block, or -1 if absent/invalid
long long content_length(const std::string& head) {
    std::istringstream stream(head);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (!iequals(line.substr(0, colon), "Content-Length")) continue;
        try {
            return std::stoll(line.substr(colon + 1));
        } catch (const std::exception&) {
            return -1;
        }
    }
    return -1;
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) return value;
    }
    return "";
}

HttpServer::HttpServer(int port) : port_(port) {}

HttpServer::~HttpServer() {
    stop();
    if (!drain(std::chrono::seconds(SHUTDOWN_DRAIN_SECONDS))) {
        std::cerr << "[Server] Destroyed with " << active_connections()
                  << " connection(s) still open" << std::endl;
    }
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = handler;
}

void HttpServer::start() {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port_);

    if (bind(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        throw std::runtime_error("Failed to bind to port " + std::to_string(port_));
    }

    if (listen(fd, LISTEN_BACKLOG) < 0) {
        close(fd);
        throw std::runtime_error("Failed to listen");
    }

    socklen_t addr_len = sizeof(addr);
    getsockname(fd, (struct sockaddr*)&addr, &addr_len);
    bound_port_ = ntohs(addr.sin_port);

    server_fd_ = fd;
    running_ = true;
    std::cout << "[Server] Listening on port " << bound_port_ << std::endl;

    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(fd, (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (running_ && (errno == EINTR || errno == ECONNABORTED)) continue;
            break;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string client_ip = ip;

        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            active_connections_++;
        }
        std::thread([this, client_fd, client_ip]() {
            handle_client(client_fd, client_ip);
            close(client_fd);

            std::lock_guard<std::mutex> lock(connections_mutex_);
            active_connections_--;
            connections_cv_.notify_all();
        }).detach();
    }

    running_ = false;
    int open_fd = server_fd_.exchange(-1);
    if (open_fd >= 0) close(open_fd);
}

void HttpServer::stop() {
    running_ = false;
    int fd = server_fd_.exchange(-1);
    if (fd >= 0) {
        // shutdown() wakes a thread blocked in accept()
        shutdown(fd, SHUT_RDWR);
        close(fd);
    }
}

bool HttpServer::drain(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(connections_mutex_);
    return connections_cv_.wait_for(lock, timeout, [this] { return active_connections_ == 0; });
}

size_t HttpServer::active_connections() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return active_connections_;
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    std::string request_data;
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    size_t expected_size = 0;

    while (true) {
        ssize_t bytes_read = read(client_fd, buffer, sizeof(buffer));
        if (bytes_read < 0 && errno == EINTR) continue;
        if (bytes_read <= 0) break;
        request_data.append(buffer, bytes_read);

        if (expected_size == 0) {
            size_t header_end = request_data.find("\r\n\r\n");
            if (header_end == std::string::npos) {
                if (request_data.size() > MAX_REQUEST_SIZE) break;
                continue;
            }

            long long length = content_length(request_data.substr(0, header_end));
            expected_size = header_end + 4 + static_cast<size_t>(std::max(0LL, length));

            // Reject before reading an oversized body
            if (expected_size > MAX_REQUEST_SIZE) {
                HttpResponse resp;
                resp.status_code = 413;
                resp.body = error_body("Request exceeds " + std::to_string(MAX_REQUEST_SIZE) + " bytes");
                write_all(client_fd, build_response(resp));
                return;
            }
        }

        if (request_data.size() >= expected_size) break;
    }

    if (request_data.empty()) return;

    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;

    write_all(client_fd, build_response(dispatch(req)));
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) const {
    HttpResponse resp;

    const HandlerFunc* handler = nullptr;
    auto exact = routes_.find(req.method + " " + req.path);
    if (exact != routes_.end()) {
        handler = &exact->second;
    } else {
        // Longest prefix wins, e.g. "/result/" for "/result/{id}"
        size_t best = 0;
        for (const auto& [pattern, candidate] : routes_) {
            size_t space_pos = pattern.find(' ');
            std::string method = pattern.substr(0, space_pos);
            std::string path_pattern = pattern.substr(space_pos + 1);

            if (method == req.method && path_pattern.size() > 1 && path_pattern.back() == '/' &&
                req.path.compare(0, path_pattern.size(), path_pattern) == 0 &&
                path_pattern.size() > best) {
                best = path_pattern.size();
                handler = &candidate;
            }
        }
    }

    if (!handler) {
        resp.status_code = 404;
        resp.body = error_body("Not found");
        return resp;
    }

    try {
        resp = (*handler)(req);
    } catch (const std::exception& e) {
        std::cerr << "[Server] " << req.method << " " << req.path << " failed: " << e.what() << std::endl;
        resp = HttpResponse();
        resp.status_code = 500;
        resp.body = error_body(e.what());
    }
    return resp;
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t header_end = raw.find("\r\n\r\n");
    std::string head = header_end == std::string::npos ? raw : raw.substr(0, header_end);
    if (header_end != std::string::npos) {
        req.body = raw.substr(header_end + 4);
    }

    std::istringstream stream(head);
    std::string line;

    // Request line
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);
    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        std::string target = line.substr(space1 + 1, space2 - space1 - 1);

        size_t question = target.find('?');
        req.path = target.substr(0, question);
        if (question != std::string::npos) {
            req.query = target.substr(question + 1);
        }
    }

    // Headers
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

std::string HttpServer::status_text(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 410: return "Gone";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    out << "HTTP/1.1 " << resp.status_code << " " << status_text(resp.status_code) << "\r\n";
    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }
    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";
    out << resp.body;

    return out.str();
}

} // namespace sandpool
