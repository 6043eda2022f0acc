#pragma once

#include "image_denoiser/config/configuration.hpp"
#include "image_denoiser/core/events.hpp"
#include "image_denoiser/service/request_handler.hpp"

#include <memory>
#include <string>

namespace image_denoiser::service {

// HTTP/1.1 front end. Socket I/O runs on server.io_threads; every request
// is handed to a pool of server.workers threads so processing never
// blocks accept/read.
class HttpServer {
public:
    HttpServer(const config::ServerConfig& cfg, const RequestHandler& handler,
               core::EventEmitter& events);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind and listen. Throws IOError.
    void start();

    // Bound port; differs from the configured one when that was 0.
    unsigned short port() const;

    // Serve until stop() or SIGINT/SIGTERM. Returns what stopped it.
    std::string run();

    void stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace image_denoiser::service
