#include "image_denoiser/core/events.hpp"
#include "image_denoiser/core/utils.hpp"

namespace image_denoiser::core {

json EventEmitter::base_event(const std::string& type, const std::string& request_id) {
    return {
        {"type", type},
        {"request_id", request_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    const std::string line = event.dump();
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << "\n";
    out_.flush();
}

void EventEmitter::server_start(const json& extra) {
    json event = base_event("server_start", "");
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::server_stop(const std::string& status) {
    json event = base_event("server_stop", "");
    event["status"] = status;
    emit(event);
}

void EventEmitter::model_load(const std::string& path, bool success,
                              const std::string& message, const json& extra) {
    json event = base_event("model_load", "");
    event["path"] = path;
    event["success"] = success;
    event["message"] = message;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::request_start(const std::string& request_id, const std::string& content_type,
                                 size_t body_bytes) {
    json event = base_event("request_start", request_id);
    event["content_type"] = content_type;
    event["body_bytes"] = body_bytes;
    emit(event);
}

void EventEmitter::request_end(const std::string& request_id, int status,
                               const std::string& reason, double elapsed_ms,
                               const json& extra) {
    json event = base_event("request_end", request_id);
    event["status"] = status;
    event["success"] = status >= 200 && status < 300;
    if (!reason.empty()) {
        event["reason"] = reason;
    }
    event["elapsed_ms"] = elapsed_ms;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::warning(const std::string& request_id, const std::string& message) {
    json event = base_event("warning", request_id);
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& request_id, const std::string& message) {
    json event = base_event("error", request_id);
    event["message"] = message;
    emit(event);
}

} // namespace image_denoiser::core
