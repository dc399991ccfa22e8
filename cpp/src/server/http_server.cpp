#include "sqlcas/server/http_server.hpp"

#include <sys/socket.h>

#include <csignal>
#include <cstdio>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

namespace sqlcas::server {

using namespace sqlcas::core;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

HttpServer::HttpServer(ServerConfig cfg, sqlcas::bindings::http::ServiceContext& ctx)
    : cfg_(std::move(cfg)),
      ctx_(ctx),
      acceptor_(ioc_) {}

HttpServer::~HttpServer() {
    stop();
    std::unique_lock<std::mutex> lock(sessions_mutex_);
    sessions_cv_.wait(lock, [this] { return sessions_.empty(); });
}

Status HttpServer::listen(std::string* detail) noexcept {
    beast::error_code ec;
    const asio::ip::address addr = asio::ip::make_address(cfg_.host, ec);
    if (ec) {
        if (detail) *detail = "invalid host " + cfg_.host + ": " + ec.message();
        return make_status(StatusDomain::Server, StatusCode::Invalid);
    }
    const tcp::endpoint endpoint{addr, cfg_.port};

    auto failed = [&](const char* what) {
        if (detail) *detail = std::string(what) + " " + cfg_.host + ":" + std::to_string(cfg_.port) + ": " + ec.message();
        beast::error_code ignored;
        acceptor_.close(ignored);
        return make_status(StatusDomain::Server, StatusCode::Unavailable, static_cast<u32>(ec.value()));
    };

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) return failed("cannot open");
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) return failed("cannot configure");
    acceptor_.bind(endpoint, ec);
    if (ec) return failed("cannot bind");
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) return failed("cannot listen on");
    return ok_status();
}

u16 HttpServer::port() const noexcept {
    beast::error_code ec;
    const tcp::endpoint ep = acceptor_.local_endpoint(ec);
    return ec ? u16{0} : ep.port();
}

Status HttpServer::run() noexcept {
    if (!acceptor_.is_open()) {
        return make_status(StatusDomain::Server, StatusCode::Invalid);
    }

    Status result = ok_status();
    try {
        asio::signal_set signals(ioc_, SIGINT, SIGTERM);
        signals.async_wait([this](const beast::error_code& ec, int) {
            if (!ec) stop();
        });
        do_accept();
        ioc_.run();
    } catch (const std::exception& e) {
        std::fprintf(stderr, "error: server loop: %s\n", e.what());
        result = make_status(StatusDomain::Server, StatusCode::Unknown);
    }

    stop();
    std::unique_lock<std::mutex> lock(sessions_mutex_);
    sessions_cv_.wait(lock, [this] { return sessions_.empty(); });
    return result;
}

void HttpServer::stop() noexcept {
    try {
        asio::post(ioc_, [this] {
            beast::error_code ec;
            acceptor_.close(ec);
            ioc_.stop();
        });
    } catch (const std::exception& e) {
        std::fprintf(stderr, "error: cannot stop server: %s\n", e.what());
    }

    // Wake sessions blocked in a keep-alive read.
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (const auto& s : sessions_) {
        ::shutdown(s->native_handle(), SHUT_RDWR);
    }
}

void HttpServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            std::fprintf(stderr, "error: accept: %s\n", ec.message().c_str());
        } else {
            start_session(std::move(socket));
        }
        if (acceptor_.is_open()) {
            do_accept();
        }
    });
}

void HttpServer::start_session(Socket socket) {
    auto sock = std::make_shared<Socket>(std::move(socket));
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.insert(sock);
    }
    try {
        std::thread([this, sock] {
            serve_session(*sock);
            end_session(sock);
        }).detach();
    } catch (const std::system_error& e) {
        std::fprintf(stderr, "error: cannot start connection thread: %s\n", e.what());
        end_session(sock);
    }
}

void HttpServer::end_session(const std::shared_ptr<Socket>& socket) {
    beast::error_code ec;
    socket->close(ec);
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(socket);
    sessions_cv_.notify_all();
}

void HttpServer::serve_session(Socket& socket) {
    beast::flat_buffer buffer;
    beast::error_code ec;

    for (;;) {
        http::request<http::string_body> req;
        http::read(socket, buffer, req, ec);
        if (ec) {
            if (ec != http::error::end_of_stream && cfg_.verbose) {
                std::fprintf(stderr, "info: connection closed: %s\n", ec.message().c_str());
            }
            break;
        }

        sqlcas::bindings::http::HttpRequest hreq{std::string(req.method_string()), std::string(req.target())};
        sqlcas::bindings::http::HttpResponse hres;
        const Status s = sqlcas::bindings::http::handle_http_request(ctx_, hreq, &hres);
        if (cfg_.verbose) {
            std::fprintf(stderr, "info: %s %s -> %u%s%s\n",
                         hreq.method.c_str(), hreq.target.c_str(), static_cast<unsigned>(hres.status),
                         is_ok(s) ? "" : " ", is_ok(s) ? "" : status_code_name(s.code));
        }

        http::response<http::string_body> res{static_cast<http::status>(hres.status), req.version()};
        res.set(http::field::server, "sqlcas");
        if (!hres.content_type.empty()) {
            res.set(http::field::content_type, hres.content_type);
        }
        for (const auto& h : hres.headers) {
            res.set(h.name, h.value);
        }
        res.keep_alive(req.keep_alive());
        res.body() = std::move(hres.body);
        res.prepare_payload();
        if (req.method() == http::verb::head) {
            const auto len = res.body().size();
            res.body().clear();
            res.content_length(len);
        }

        http::write(socket, res, ec);
        if (ec || !res.keep_alive()) {
            break;
        }
    }

    socket.shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace sqlcas::server
