#include "image_denoiser/core/events.hpp"
#include "image_denoiser/io/image_codec.hpp"
#include "image_denoiser/pipeline/dispatcher.hpp"
#include "image_denoiser/service/http_server.hpp"
#include "image_denoiser/service/request_handler.hpp"
#include "test_support.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

using namespace image_denoiser;
using nlohmann::json;

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

const std::string kBoundary = "XserverX";

cdae::ModelHandle::Loader identity_after(std::chrono::milliseconds delay) {
    return [delay]() -> std::unique_ptr<cdae::DenoisingModel> {
        std::this_thread::sleep_for(delay);
        return test::identity_model(1, 16);
    };
}

std::string denoise_body(const std::string& method, int size) {
    const auto png = io::encode_image(test::make_noisy(size, size, 1));
    std::string body = "--" + kBoundary + "\r\n" +
                       "Content-Disposition: form-data; name=\"file\"; filename=\"a.png\"\r\n" +
                       "Content-Type: image/png\r\n\r\n" + std::string(png.begin(), png.end()) + "\r\n";
    body += "--" + kBoundary + "\r\nContent-Disposition: form-data; name=\"method\"\r\n\r\n" + method +
            "\r\n";
    body += "--" + kBoundary + "--\r\n";
    return body;
}

http::request<http::string_body> get_request(const std::string& target) {
    http::request<http::string_body> req{http::verb::get, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.keep_alive(true);
    return req;
}

http::request<http::string_body> denoise_request(const std::string& method, int size = 16) {
    http::request<http::string_body> req{http::verb::post, "/api/denoise", 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::content_type, "multipart/form-data; boundary=" + kBoundary);
    req.keep_alive(true);
    req.body() = denoise_body(method, size);
    req.prepare_payload();
    return req;
}

json body_json(const http::response<http::string_body>& res) {
    REQUIRE(res[http::field::content_type] == "application/json");
    return json::parse(res.body());
}

// Blocking client on its own connection.
struct Client {
    explicit Client(unsigned short port) : socket(ioc) {
        socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
    }

    void write(const http::request<http::string_body>& req) { http::write(socket, req); }

    http::response<http::string_body> read() {
        http::response<http::string_body> res;
        http::read(socket, buffer, res);
        return res;
    }

    http::response<http::string_body> send(const http::request<http::string_body>& req) {
        write(req);
        return read();
    }

    net::io_context ioc;
    tcp::socket socket;
    beast::flat_buffer buffer;
};

// Server on an ephemeral loopback port, served from a background thread.
struct RunningServer {
    RunningServer(const config::Config& base, const cdae::ModelHandle::Loader& loader) : cfg(base) {
        cfg.server.host = "127.0.0.1";
        cfg.server.port = 0;
        model = std::make_unique<cdae::ModelHandle>("memory", loader, &events);
        dispatcher = std::make_unique<pipeline::Dispatcher>(cfg, *model);
        handler = std::make_unique<service::RequestHandler>(cfg, *dispatcher, *model, events);
        server = std::make_unique<service::HttpServer>(cfg.server, *handler, events);
        server->start();
        port = server->port();
        thread = std::thread([this]() { server->run(); });
    }

    ~RunningServer() {
        server->stop();
        thread.join();
    }

    config::Config cfg;
    std::ostringstream log;
    core::EventEmitter events{log};
    std::unique_ptr<cdae::ModelHandle> model;
    std::unique_ptr<pipeline::Dispatcher> dispatcher;
    std::unique_ptr<service::RequestHandler> handler;
    std::unique_ptr<service::HttpServer> server;
    unsigned short port = 0;
    std::thread thread;
};

} // namespace

TEST_CASE("server_answers_repeated_requests_on_one_connection") {
    RunningServer srv(config::Config(), identity_after(std::chrono::milliseconds(0)));
    REQUIRE(srv.port != 0);

    Client client(srv.port);
    for (int i = 0; i < 3; ++i) {
        const auto res = client.send(get_request("/api/health"));
        REQUIRE(res.result_int() == 200);
        REQUIRE(res.keep_alive());
        REQUIRE(body_json(res)["status"] == "ok");
    }
    REQUIRE(client.send(get_request("/api/nothing")).result_int() == 404);
}

TEST_CASE("server_denoises_multipart_uploads") {
    RunningServer srv(config::Config(), identity_after(std::chrono::milliseconds(0)));
    Client client(srv.port);

    for (const char* method : {"mean", "cdae"}) {
        const auto res = client.send(denoise_request(method, 24));
        REQUIRE(res.result_int() == 200);
        REQUIRE(res[http::field::content_type] == "image/png");
        REQUIRE_FALSE(res["X-Request-Id"].empty());

        const std::string& body = res.body();
        const ImageBuffer out = io::decode_image(std::vector<uint8_t>(body.begin(), body.end()));
        REQUIRE(out.width() == 24);
        REQUIRE(out.height() == 24);
    }
}

TEST_CASE("server_rejects_bodies_over_the_upload_limit") {
    config::Config cfg;
    cfg.server.max_upload_bytes = 100;
    RunningServer srv(cfg, identity_after(std::chrono::milliseconds(0)));
    Client client(srv.port);

    http::request<http::string_body> req{http::verb::post, "/api/denoise", 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::content_type, "multipart/form-data; boundary=" + kBoundary);
    req.body() = std::string(300, 'x');
    req.prepare_payload();

    const auto res = client.send(req);
    REQUIRE(res.result_int() == 413);
    REQUIRE_FALSE(res.keep_alive());
    REQUIRE(body_json(res)["reason"] == "upload_too_large");
}

TEST_CASE("server_keeps_serving_after_a_timeout") {
    config::Config cfg;
    cfg.server.workers = 1;
    cfg.server.request_timeout_ms = 300;
    RunningServer srv(cfg, identity_after(std::chrono::milliseconds(600)));

    {
        Client client(srv.port);
        const auto res = client.send(denoise_request("cdae"));
        REQUIRE(res.result_int() == 504);
        REQUIRE(body_json(res)["reason"] == "timeout");
    }

    Client next(srv.port);
    REQUIRE(next.send(denoise_request("mean")).result_int() == 200);
    REQUIRE(next.send(denoise_request("cdae")).result_int() == 200);
}

TEST_CASE("time_queued_behind_a_busy_worker_counts_against_the_budget") {
    config::Config cfg;
    cfg.server.workers = 1;
    cfg.server.request_timeout_ms = 300;
    RunningServer srv(cfg, identity_after(std::chrono::milliseconds(600)));

    Client slow(srv.port);
    slow.write(denoise_request("cdae"));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    Client queued(srv.port);
    const auto res = queued.send(denoise_request("mean"));
    REQUIRE(res.result_int() == 504);
    REQUIRE(body_json(res)["error"].get<std::string>().find("queue wait") != std::string::npos);

    REQUIRE(slow.read().result_int() == 504);
}

TEST_CASE("server_refuses_requests_beyond_the_pending_limit") {
    config::Config cfg;
    cfg.server.workers = 1;
    cfg.server.max_pending = 1;
    cfg.server.request_timeout_ms = 10000;
    RunningServer srv(cfg, identity_after(std::chrono::milliseconds(400)));

    Client slow(srv.port);
    slow.write(denoise_request("cdae"));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    Client extra(srv.port);
    const auto busy = extra.send(denoise_request("mean"));
    REQUIRE(busy.result_int() == 503);
    REQUIRE(body_json(busy)["reason"] == "server_busy");

    REQUIRE(slow.read().result_int() == 200);
    REQUIRE(extra.send(denoise_request("mean")).result_int() == 200);
}
