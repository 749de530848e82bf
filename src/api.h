#pragma once

#include <string>
#include <json/json.h>
#include "cleanup_reaper.h"
#include "executor.h"
#include "http_server.h"
#include "prewarm_pool.h"
#include "session_table.h"

namespace sandpool {

// Serialize a JSON body into a response with the given status
HttpResponse json_response(int status_code, const Json::Value& body);

// REST surface over the lifecycle core:
//
//   POST /execute        multipart upload, field "file" -> {"session_id"}
//   GET  /result/{id}    200 logs, 202 still running, 410 cleaned up, 404
//   POST /cleanup/{id}   200 cleaned up, 404
//   POST /prewarm        wake the replenisher
//   GET  /health, /stats
class Api {
public:
    Api(SessionTable& sessions, PrewarmPool& pool, Executor& executor, CleanupReaper& reaper);

    void register_routes(HttpServer& server);

    HttpResponse execute(const HttpRequest& req);
    HttpResponse result(const HttpRequest& req);
    HttpResponse cleanup(const HttpRequest& req);
    HttpResponse prewarm(const HttpRequest& req);
    HttpResponse health(const HttpRequest& req);
    HttpResponse stats(const HttpRequest& req);

private:
    // Trailing path segment after prefix; empty if absent or nested
    static std::string path_id(const std::string& path, const std::string& prefix);

    SessionTable& sessions_;
    PrewarmPool& pool_;
    Executor& executor_;
    CleanupReaper& reaper_;
};

} // namespace sandpool
