#include "image_denoiser/service/request_handler.hpp"
#include "image_denoiser/core/utils.hpp"
#include "image_denoiser/service/multipart.hpp"

#include <algorithm>
#include <chrono>

namespace image_denoiser::service {

namespace {

using Clock = std::chrono::steady_clock;

bool is_accepted_media_type(const std::string& content_type) {
    const auto fields = core::split(content_type, ';');
    const std::string ct = fields.empty() ? std::string() : core::to_lower(core::trim(fields[0]));
    return ct.empty() || core::starts_with(ct, "image/") || ct == "application/octet-stream";
}

HttpResponse method_not_allowed(const std::string& method, const std::string& path) {
    return json_error(405, "Method " + method + " not allowed on " + path, "method_not_allowed");
}

std::string field_text(const std::vector<MultipartPart>& parts, const std::string& name) {
    const MultipartPart* p = find_part(parts, name);
    return p ? p->data : std::string();
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(core::to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

std::string HttpRequest::path() const {
    const auto q = target.find('?');
    return q == std::string::npos ? target : target.substr(0, q);
}

std::string HttpResponse::header(const std::string& name) const {
    const std::string key = core::to_lower(name);
    for (const auto& [k, v] : headers) {
        if (core::to_lower(k) == key) return v;
    }
    return {};
}

int http_status_for(ErrorReason reason) {
    switch (reason) {
        case ErrorReason::INVALID_METHOD:
        case ErrorReason::INVALID_STRENGTH:
        case ErrorReason::INVALID_UPLOAD:
        case ErrorReason::DECODE_ERROR:
            return 400;
        case ErrorReason::UPLOAD_TOO_LARGE:
            return 413;
        case ErrorReason::UNSUPPORTED_MEDIA_TYPE:
            return 415;
        case ErrorReason::MODEL_UNAVAILABLE:
        case ErrorReason::SERVER_BUSY:
            return 503;
        case ErrorReason::TIMEOUT:
            return 504;
        default:
            return 500;
    }
}

HttpResponse json_response(int status, const core::json& body) {
    HttpResponse r;
    r.status = status;
    r.content_type = "application/json";
    r.body = body.dump();
    return r;
}

HttpResponse json_error(int status, const std::string& message, const std::string& reason) {
    return json_response(status, {{"error", message}, {"reason", reason}});
}

RequestHandler::RequestHandler(const config::Config& cfg, const pipeline::Dispatcher& dispatcher,
                               const cdae::ModelHandle& model, core::EventEmitter& events)
    : server_(cfg.server), dispatcher_(dispatcher), model_(model), events_(events) {}

core::Deadline RequestHandler::request_deadline() const {
    return server_.request_timeout_ms > 0
               ? core::Deadline::after(std::chrono::milliseconds(server_.request_timeout_ms))
               : core::Deadline::none();
}

HttpResponse RequestHandler::handle(const HttpRequest& request) const {
    return handle(request, request_deadline());
}

HttpResponse RequestHandler::handle(const HttpRequest& request, const core::Deadline& deadline) const {
    HttpResponse response;
    try {
        response = route(request, deadline);
    } catch (const std::exception& e) {
        events_.error("", std::string("unhandled error in ") + request.method + " " + request.path() +
                              ": " + e.what());
        response = json_error(500, e.what(), error_reason_to_string(ErrorReason::INTERNAL));
    }
    apply_cors(request, response);
    return response;
}

HttpResponse RequestHandler::reject(const HttpRequest& request, const DenoiserError& error) const {
    events_.warning("", std::string("rejected ") + request.method + " " + request.path() + ": " +
                            error.what());
    HttpResponse response =
        json_error(http_status_for(error.reason()), error.what(), error_reason_to_string(error.reason()));
    apply_cors(request, response);
    return response;
}

HttpResponse RequestHandler::route(const HttpRequest& request, const core::Deadline& deadline) const {
    const std::string path = request.path();
    const std::string method = request.method;

    if (method == "OPTIONS" && core::starts_with(path, "/api/")) {
        HttpResponse r;
        r.status = 204;
        return r;
    }
    if (path == "/api/health") {
        if (method != "GET") return method_not_allowed(method, path);
        return json_response(200, {{"status", "ok"}});
    }
    if (path == "/api/methods") {
        if (method != "GET") return method_not_allowed(method, path);
        return handle_methods();
    }
    if (path == "/api/denoise") {
        if (method != "POST") return method_not_allowed(method, path);
        return handle_denoise(request, deadline);
    }
    return json_error(404, "Not found: " + path, "not_found");
}

HttpResponse RequestHandler::handle_methods() const {
    core::json methods = core::json::array();
    for (DenoiseMethod m : all_methods()) {
        methods.push_back(method_to_string(m));
    }

    std::string state = "not_loaded";
    if (model_.attempted()) state = model_.available() ? "ready" : "failed";

    core::json cdae = {
        {"state", state},
        {"available", model_.available()},
        {"source", model_.source()}
    };
    if (state == "failed") cdae["message"] = model_.failure_message();

    return json_response(200, {
        {"methods", methods},
        {"default_method", "cdae"},
        {"default_strength", 0.5},
        {"strength_policy", "reject"},
        {"strength_range", {0.0, 1.0}},
        {"cdae", cdae},
        {"output_format", image_format_to_string(dispatcher_.encode_options().format)}
    });
}

HttpResponse RequestHandler::handle_denoise(const HttpRequest& request,
                                            const core::Deadline& deadline) const {
    const std::string request_id = core::make_request_id();
    const auto t0 = Clock::now();
    const auto elapsed_ms = [&t0]() {
        return std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
    };

    events_.request_start(request_id, request.header("content-type"), request.body.size());

    core::json fields = core::json::object();
    try {
        // The budget also covers time spent waiting for a worker.
        deadline.check("queue wait");

        if (server_.max_upload_bytes > 0 &&
            static_cast<long long>(request.body.size()) > server_.max_upload_bytes) {
            throw UploadTooLargeError("request body is " + std::to_string(request.body.size()) +
                                      " bytes, limit is " + std::to_string(server_.max_upload_bytes) +
                                      " bytes");
        }

        const auto boundary = multipart_boundary(request.header("content-type"));
        if (!boundary) {
            throw InvalidUploadError("expected a multipart/form-data body");
        }
        const std::vector<MultipartPart> parts = parse_multipart(request.body, *boundary);

        const MultipartPart* file = find_part(parts, "file");
        const std::string method_text = field_text(parts, "method");
        const std::string strength_text = field_text(parts, "strength");
        fields["method_field"] = method_text;
        fields["strength_field"] = strength_text;
        fields["upload_bytes"] = file ? file->data.size() : 0;

        if (!file) {
            throw InvalidUploadError("missing 'file' field");
        }
        if (!is_accepted_media_type(file->content_type)) {
            throw UnsupportedMediaTypeError(file->content_type);
        }

        const pipeline::DenoiseRequest denoise_request = pipeline::DenoiseRequest::from_fields(
            std::vector<uint8_t>(file->data.begin(), file->data.end()), method_text, strength_text);

        const pipeline::DenoiseResult result = dispatcher_.process(denoise_request, deadline);

        HttpResponse r;
        r.status = 200;
        r.content_type = result.content_type;
        r.body.assign(result.data.begin(), result.data.end());
        r.headers.emplace_back("X-Request-Id", request_id);

        core::json extra = {
            {"method", method_to_string(result.method)},
            {"strength", result.strength},
            {"width", result.width},
            {"height", result.height},
            {"channels", result.channels},
            {"bytes_out", result.data.size()},
            {"decode_ms", result.decode_ms},
            {"denoise_ms", result.denoise_ms},
            {"encode_ms", result.encode_ms}
        };
        extra.update(fields);
        events_.request_end(request_id, 200, "", elapsed_ms(), extra);
        return r;
    } catch (const DenoiserError& e) {
        const int status = http_status_for(e.reason());
        const std::string reason = error_reason_to_string(e.reason());
        core::json extra = fields;
        if (const auto* pe = dynamic_cast<const ProcessError*>(&e)) {
            extra["stage"] = process_stage_to_string(pe->stage());
        }
        if (status >= 500) {
            events_.error(request_id, e.what());
        }
        events_.request_end(request_id, status, reason, elapsed_ms(), extra);

        HttpResponse r = json_error(status, e.what(), reason);
        r.headers.emplace_back("X-Request-Id", request_id);
        return r;
    }
}

void RequestHandler::apply_cors(const HttpRequest& request, HttpResponse& response) const {
    const std::string origin = request.header("origin");
    if (origin.empty()) return;

    const auto& allowed = server_.cors_allowed_origins;
    const bool wildcard = std::find(allowed.begin(), allowed.end(), "*") != allowed.end();
    if (!wildcard && std::find(allowed.begin(), allowed.end(), origin) == allowed.end()) {
        return;
    }

    response.headers.emplace_back("Access-Control-Allow-Origin", wildcard ? "*" : origin);
    response.headers.emplace_back("Vary", "Origin");
    if (request.method == "OPTIONS") {
        response.headers.emplace_back("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        response.headers.emplace_back("Access-Control-Allow-Headers", "Content-Type");
        response.headers.emplace_back("Access-Control-Max-Age", "600");
    }
}

} // namespace image_denoiser::service
