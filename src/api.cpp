#include "api.h"
#include "errors.h"
#include "multipart.h"
#include "payload.h"

#include <iostream>

namespace sandpool {

namespace {

HttpResponse session_not_found() {
    Json::Value body;
    body["error"] = "Session not found";
    return json_response(404, body);
}

HttpResponse status_response(int status_code, const std::string& status) {
    Json::Value body;
    body["status"] = status;
    return json_response(status_code, body);
}

} // namespace

HttpResponse json_response(int status_code, const Json::Value& body) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";

    HttpResponse resp;
    resp.status_code = status_code;
    resp.body = Json::writeString(builder, body);
    return resp;
}

Api::Api(SessionTable& sessions, PrewarmPool& pool, Executor& executor, CleanupReaper& reaper)
    : sessions_(sessions), pool_(pool), executor_(executor), reaper_(reaper) {}

void Api::register_routes(HttpServer& server) {
    server.route("POST", "/execute", [this](const HttpRequest& req) { return execute(req); });
    server.route("GET", "/result/", [this](const HttpRequest& req) { return result(req); });
    server.route("POST", "/cleanup/", [this](const HttpRequest& req) { return cleanup(req); });
    server.route("POST", "/prewarm", [this](const HttpRequest& req) { return prewarm(req); });
    server.route("GET", "/health", [this](const HttpRequest& req) { return health(req); });
    server.route("GET", "/stats", [this](const HttpRequest& req) { return stats(req); });
}

HttpResponse Api::execute(const HttpRequest& req) {
    Payload payload;
    try {
        auto parts = MultipartParser::parse(req.header("Content-Type"), req.body);
        payload = Payload::from_upload(parts);
    } catch (const InvalidPayloadError& e) {
        std::cout << "[Server] Rejected upload from " << req.client_ip << ": " << e.what() << std::endl;
        Json::Value body;
        body["error"] = e.what();
        return json_response(400, body);
    }

    Json::Value body;
    body["session_id"] = executor_.submit(payload);
    return json_response(200, body);
}

HttpResponse Api::result(const HttpRequest& req) {
    std::string id = path_id(req.path, "/result/");
    if (id.empty()) return session_not_found();

    Session session;
    try {
        session = sessions_.get(id);
    } catch (const SessionNotFoundError&) {
        return session_not_found();
    }

    switch (session.state) {
        case SessionState::PENDING:
        case SessionState::RUNNING:
            return status_response(202, "still running");
        case SessionState::CLEANED_UP:
            return status_response(410, "cleaned up");
        case SessionState::COMPLETED:
        case SessionState::FAILED:
            break;
    }

    Json::Value body;
    body["logs"] = session.output;
    body["status"] = session.state == SessionState::COMPLETED ? "completed" : "failed";
    if (session.state == SessionState::COMPLETED) {
        body["exit_code"] = session.exit_code;
    }
    if (session.output_truncated) {
        body["truncated"] = true;
    }
    return json_response(200, body);
}

HttpResponse Api::cleanup(const HttpRequest& req) {
    std::string id = path_id(req.path, "/cleanup/");
    if (id.empty()) return session_not_found();

    try {
        reaper_.cleanup(id);
    } catch (const SessionNotFoundError&) {
        return session_not_found();
    }
    return status_response(200, "cleaned up");
}

HttpResponse Api::prewarm(const HttpRequest&) {
    pool_.trigger_replenish();
    return status_response(200, "prewarm triggered");
}

HttpResponse Api::health(const HttpRequest&) {
    return status_response(200, "ok");
}

HttpResponse Api::stats(const HttpRequest&) {
    auto pool = pool_.stats();

    Json::Value body;
    Json::Value& pool_json = body["pool"];
    pool_json["target_size"] = static_cast<Json::UInt64>(pool.target_size);
    pool_json["idle"] = static_cast<Json::UInt64>(pool.idle);
    pool_json["reserved"] = static_cast<Json::UInt64>(pool.reserved);
    pool_json["executing"] = static_cast<Json::UInt64>(pool.executing);
    pool_json["creating"] = static_cast<Json::UInt64>(pool.creating);
    pool_json["created_total"] = static_cast<Json::UInt64>(pool.created_total);
    pool_json["retired_total"] = static_cast<Json::UInt64>(pool.retired_total);

    Json::Value& sessions_json = body["sessions"];
    for (auto state : {SessionState::PENDING, SessionState::RUNNING, SessionState::COMPLETED,
                       SessionState::FAILED, SessionState::CLEANED_UP}) {
        sessions_json[session_state_to_string(state)] = 0;
    }
    for (const auto& session : sessions_.snapshot()) {
        Json::Value& count = sessions_json[session_state_to_string(session.state)];
        count = count.asInt() + 1;
    }

    body["queued"] = static_cast<Json::UInt64>(executor_.pending());
    return json_response(200, body);
}

std::string Api::path_id(const std::string& path, const std::string& prefix) {
    if (path.compare(0, prefix.size(), prefix) != 0) return "";
    std::string id = path.substr(prefix.size());
    if (id.find('/') != std::string::npos) return "";
    return id;
}

} // namespace sandpool
