#include "image_denoiser/service/http_server.hpp"
#include "image_denoiser/core/errors.hpp"
#include "image_denoiser/core/utils.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <optional>
#include <thread>
#include <vector>

namespace image_denoiser::service {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

HttpRequest to_request(const http::request<http::string_body>& req) {
    HttpRequest out;
    out.method = std::string(req.method_string());
    out.target = std::string(req.target());
    for (const auto& field : req) {
        out.headers[core::to_lower(std::string(field.name_string()))] = std::string(field.value());
    }
    out.body = req.body();
    return out;
}

http::response<http::string_body> to_beast(const HttpResponse& r, unsigned version, bool keep_alive) {
    http::response<http::string_body> res{static_cast<http::status>(r.status), version};
    res.set(http::field::server, "image_denoiser");
    if (!r.content_type.empty()) {
        res.set(http::field::content_type, r.content_type);
    }
    for (const auto& [name, value] : r.headers) {
        res.insert(name, value);
    }
    res.keep_alive(keep_alive);
    res.body() = r.body;
    res.prepare_payload();
    return res;
}

bool is_quiet_error(const beast::error_code& ec) {
    return ec == net::error::operation_aborted || ec == beast::error::timeout ||
           ec == net::error::connection_reset || ec == http::error::end_of_stream;
}

// Requests handed to the worker pool and not yet answered.
struct PendingGauge {
    std::atomic<int> count{0};
    int limit = 1;
};

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket, const config::ServerConfig& cfg, const RequestHandler& handler,
            net::thread_pool& workers, PendingGauge& pending, core::EventEmitter& events)
        : stream_(std::move(socket)), cfg_(cfg), handler_(handler), workers_(workers),
          pending_(pending), events_(events) {}

    void run() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&Session::do_read, shared_from_this()));
    }

private:
    std::chrono::milliseconds timeout() const {
        return std::chrono::milliseconds(cfg_.request_timeout_ms > 0 ? cfg_.request_timeout_ms : 30000);
    }

    void do_read() {
        parser_.emplace();
        if (cfg_.max_upload_bytes > 0) {
            parser_->body_limit(static_cast<std::uint64_t>(cfg_.max_upload_bytes));
        }
        stream_.expires_after(timeout());
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return do_close();
        }
        if (ec == http::error::body_limit) {
            const auto& header = parser_->get();
            HttpRequest request = to_request(header);
            request.body.clear();
            const UploadTooLargeError error("request body exceeds " +
                                            std::to_string(cfg_.max_upload_bytes) + " bytes");
            return write(handler_.reject(request, error), header.version(), false);
        }
        if (ec) {
            if (!is_quiet_error(ec)) {
                events_.warning("", "read failed: " + ec.message());
            }
            return do_close();
        }

        // The budget starts once the request is read, so queueing counts.
        const core::Deadline deadline = handler_.request_deadline();
        const http::request<http::string_body> req = parser_->release();
        const unsigned version = req.version();
        const bool keep_alive = req.keep_alive();
        HttpRequest request = to_request(req);

        const int in_flight = pending_.count.fetch_add(1);
        if (in_flight >= pending_.limit) {
            pending_.count.fetch_sub(1);
            request.body.clear();
            return write(handler_.reject(request, ServerBusyError(in_flight)), version, keep_alive);
        }

        // Processing happens off the I/O threads; the response is written
        // back on this session's strand.
        net::post(workers_, [self = shared_from_this(), request = std::move(request), deadline, version,
                             keep_alive]() mutable {
            HttpResponse response = self->handler_.handle(request, deadline);
            self->pending_.count.fetch_sub(1);
            net::post(self->stream_.get_executor(),
                      [self, response = std::move(response), version, keep_alive]() {
                          self->write(response, version, keep_alive);
                      });
        });
    }

    void write(const HttpResponse& response, unsigned version, bool keep_alive) {
        auto res = std::make_shared<http::response<http::string_body>>(
            to_beast(response, version, keep_alive));
        stream_.expires_after(timeout());
        http::async_write(stream_, *res,
                          [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
                              self->on_write(ec, res->need_eof());
                          });
    }

    void on_write(beast::error_code ec, bool close) {
        if (ec) {
            if (!is_quiet_error(ec)) {
                events_.warning("", "write failed: " + ec.message());
            }
            return do_close();
        }
        if (close) {
            return do_close();
        }
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    const config::ServerConfig& cfg_;
    const RequestHandler& handler_;
    net::thread_pool& workers_;
    PendingGauge& pending_;
    core::EventEmitter& events_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, const config::ServerConfig& cfg, const RequestHandler& handler,
             net::thread_pool& workers, PendingGauge& pending, core::EventEmitter& events)
        : ioc_(ioc), acceptor_(net::make_strand(ioc)), cfg_(cfg), handler_(handler),
          workers_(workers), pending_(pending), events_(events) {}

    void open() {
        beast::error_code ec;
        const auto address = net::ip::make_address(cfg_.host, ec);
        if (ec) {
            throw IOError("Invalid listen address '" + cfg_.host + "': " + ec.message());
        }
        const tcp::endpoint endpoint(address, static_cast<unsigned short>(cfg_.port));

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) throw IOError("Cannot open acceptor: " + ec.message());
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) throw IOError("Cannot set reuse_address: " + ec.message());
        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw IOError("Cannot bind " + cfg_.host + ":" + std::to_string(cfg_.port) + ": " +
                          ec.message());
        }
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) throw IOError("Cannot listen: " + ec.message());
    }

    void run() { do_accept(); }

    void close() {
        net::post(acceptor_.get_executor(), [self = shared_from_this()]() {
            beast::error_code ec;
            self->acceptor_.close(ec);
        });
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

private:
    void do_accept() {
        acceptor_.async_accept(net::make_strand(ioc_),
                               beast::bind_front_handler(&Listener::on_accept, shared_from_this()));
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == net::error::operation_aborted) return;
            events_.warning("", "accept failed: " + ec.message());
        } else {
            std::make_shared<Session>(std::move(socket), cfg_, handler_, workers_, pending_, events_)
                ->run();
        }
        if (acceptor_.is_open()) do_accept();
    }

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    const config::ServerConfig& cfg_;
    const RequestHandler& handler_;
    net::thread_pool& workers_;
    PendingGauge& pending_;
    core::EventEmitter& events_;
};

} // namespace

struct HttpServer::Impl {
    Impl(const config::ServerConfig& c, const RequestHandler& h, core::EventEmitter& e)
        : cfg(c), handler(h), events(e), ioc(std::max(1, c.io_threads)),
          workers(static_cast<std::size_t>(std::max(1, c.workers))) {
        pending.limit = std::max(c.max_pending, std::max(1, c.workers));
    }

    config::ServerConfig cfg;
    const RequestHandler& handler;
    core::EventEmitter& events;
    net::io_context ioc;
    net::thread_pool workers;
    PendingGauge pending;
    std::shared_ptr<Listener> listener;
    std::string stop_cause = "stopped";
};

HttpServer::HttpServer(const config::ServerConfig& cfg, const RequestHandler& handler,
                       core::EventEmitter& events)
    : impl_(std::make_unique<Impl>(cfg, handler, events)) {}

HttpServer::~HttpServer() {
    impl_->ioc.stop();
    impl_->workers.stop();
    impl_->workers.join();
}

void HttpServer::start() {
    impl_->listener =
        std::make_shared<Listener>(impl_->ioc, impl_->cfg, impl_->handler, impl_->workers,
                                   impl_->pending, impl_->events);
    impl_->listener->open();
    impl_->listener->run();
}

unsigned short HttpServer::port() const {
    if (!impl_->listener) {
        throw IOError("server is not started");
    }
    return impl_->listener->port();
}

std::string HttpServer::run() {
    if (!impl_->listener) {
        start();
    }

    net::signal_set signals(impl_->ioc, SIGINT, SIGTERM);
    signals.async_wait([this](const beast::error_code& ec, int signo) {
        if (ec) return;
        impl_->stop_cause = (signo == SIGINT) ? "sigint" : "sigterm";
        stop();
    });

    const int n = std::max(1, impl_->cfg.io_threads);
    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(n - 1));
    for (int i = 1; i < n; ++i) {
        threads.emplace_back([this]() { impl_->ioc.run(); });
    }
    impl_->ioc.run();
    for (auto& t : threads) {
        t.join();
    }

    beast::error_code ec;
    signals.cancel(ec);
    return impl_->stop_cause;
}

void HttpServer::stop() {
    if (impl_->listener) {
        impl_->listener->close();
    }
    impl_->ioc.stop();
}

} // namespace image_denoiser::service
