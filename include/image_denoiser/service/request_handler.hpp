#pragma once

#include "image_denoiser/cdae/runtime.hpp"
#include "image_denoiser/config/configuration.hpp"
#include "image_denoiser/core/deadline.hpp"
#include "image_denoiser/core/errors.hpp"
#include "image_denoiser/core/events.hpp"
#include "image_denoiser/pipeline/dispatcher.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace image_denoiser::service {

// Transport-neutral request; header names are lower-case.
struct HttpRequest {
    std::string method;
    std::string target;
    std::map<std::string, std::string> headers;
    std::string body;

    std::string header(const std::string& name) const;
    std::string path() const;
};

struct HttpResponse {
    int status = 200;
    std::string content_type;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    std::string header(const std::string& name) const;
};

int http_status_for(ErrorReason reason);

HttpResponse json_response(int status, const core::json& body);
HttpResponse json_error(int status, const std::string& message, const std::string& reason);

// Routes:
//   GET     /api/health   -> {"status":"ok"}
//   GET     /api/methods  -> methods, strength policy, CDAE availability
//   POST    /api/denoise  -> encoded image, or {"error","reason"}
//   OPTIONS /api/*        -> 204 CORS preflight
// Never throws; every failure becomes a JSON error response.
class RequestHandler {
public:
    RequestHandler(const config::Config& cfg, const pipeline::Dispatcher& dispatcher,
                   const cdae::ModelHandle& model, core::EventEmitter& events);

    // Budget of server.request_timeout_ms starting now. The transport takes
    // it when a request is fully read, before queueing it for a worker.
    core::Deadline request_deadline() const;

    // Uses request_deadline() as the processing budget.
    HttpResponse handle(const HttpRequest& request) const;
    HttpResponse handle(const HttpRequest& request, const core::Deadline& deadline) const;

    // Error response for a request the transport rejected before it was
    // complete (e.g. body over the size limit).
    HttpResponse reject(const HttpRequest& request, const DenoiserError& error) const;

private:
    HttpResponse route(const HttpRequest& request, const core::Deadline& deadline) const;
    HttpResponse handle_denoise(const HttpRequest& request, const core::Deadline& deadline) const;
    HttpResponse handle_methods() const;
    void apply_cors(const HttpRequest& request, HttpResponse& response) const;

    config::ServerConfig server_;
    const pipeline::Dispatcher& dispatcher_;
    const cdae::ModelHandle& model_;
    core::EventEmitter& events_;
};

} // namespace image_denoiser::service
