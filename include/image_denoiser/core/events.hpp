#pragma once

#include <nlohmann/json.hpp>
#include <mutex>
#include <ostream>
#include <string>

namespace image_denoiser::core {

using json = nlohmann::json;

// JSON-lines event log. One object per line; safe to share between
// request threads.
class EventEmitter {
public:
    explicit EventEmitter(std::ostream& out) : out_(out) {}

    void server_start(const json& extra);
    void server_stop(const std::string& status);

    void model_load(const std::string& path, bool success, const std::string& message,
                    const json& extra);

    void request_start(const std::string& request_id, const std::string& content_type,
                       size_t body_bytes);
    void request_end(const std::string& request_id, int status, const std::string& reason,
                     double elapsed_ms, const json& extra);

    void warning(const std::string& request_id, const std::string& message);
    void error(const std::string& request_id, const std::string& message);

private:
    void emit(const json& event);
    json base_event(const std::string& type, const std::string& request_id);

    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace image_denoiser::core
