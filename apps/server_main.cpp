#include "image_denoiser/cdae/runtime.hpp"
#include "image_denoiser/config/configuration.hpp"
#include "image_denoiser/core/errors.hpp"
#include "image_denoiser/core/events.hpp"
#include "image_denoiser/pipeline/dispatcher.hpp"
#include "image_denoiser/service/http_server.hpp"
#include "image_denoiser/service/request_handler.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <string>

using namespace image_denoiser;

int main(int argc, char* argv[]) {
    CLI::App app{"Image denoiser HTTP service"};

    std::string config_path;
    std::string host;
    int port = 0;
    int workers = 0;
    std::string model_path;
    int timeout_ms = 0;

    app.add_option("--config", config_path, "Path to image_denoiser.yaml");
    auto* host_opt = app.add_option("--host", host, "Listen address");
    auto* port_opt = app.add_option("--port", port, "Listen port");
    auto* workers_opt = app.add_option("--workers", workers, "Processing threads");
    auto* model_opt = app.add_option("--model", model_path, "CDAE weights file (.yml/.xml/.json/.onnx)");
    auto* timeout_opt = app.add_option("--timeout-ms", timeout_ms, "Per-request processing budget");

    CLI11_PARSE(app, argc, argv);

    core::EventEmitter events(std::cout);

    try {
        config::Config cfg = config_path.empty() ? config::Config() : config::Config::load(config_path);
        if (*host_opt) cfg.server.host = host;
        if (*port_opt) cfg.server.port = port;
        if (*workers_opt) cfg.server.workers = workers;
        if (*model_opt) cfg.model.path = model_path;
        if (*timeout_opt) cfg.server.request_timeout_ms = timeout_ms;
        cfg.validate();

        cdae::ModelHandle model(cfg.model, &events);
        if (cfg.model.preload && !model.preload()) {
            events.warning("", "method 'cdae' disabled until weights are available: " +
                                   model.failure_message());
        }

        pipeline::Dispatcher dispatcher(cfg, model);
        service::RequestHandler handler(cfg, dispatcher, model, events);
        service::HttpServer server(cfg.server, handler, events);
        server.start();

        events.server_start({
            {"host", cfg.server.host},
            {"port", server.port()},
            {"io_threads", cfg.server.io_threads},
            {"workers", cfg.server.workers},
            {"max_pending", cfg.server.max_pending},
            {"request_timeout_ms", cfg.server.request_timeout_ms},
            {"model", cfg.model.path},
            {"cdae_available", model.available()}
        });

        const std::string cause = server.run();
        events.server_stop(cause);
        return 0;
    } catch (const DenoiserError& e) {
        events.error("", e.what());
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        events.error("", std::string("fatal: ") + e.what());
        std::cerr << "fatal: " << e.what() << std::endl;
        return 1;
    }
}
