#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "sqlcas/bindings/http.hpp"
#include "sqlcas/core/errors.hpp"

namespace sqlcas::server {
    using u16 = sqlcas::core::u16;

    struct ServerConfig {
        std::string host{"0.0.0.0"};
        u16 port{8006};
        bool verbose{false};  // one info line per request on stderr
    };

    // HTTP/1.1 front end for handle_http_request. Connections are accepted on
    // an io_context and each one is then served by its own thread with
    // blocking reads and writes, keep-alive included.
    class HttpServer {
    public:
        HttpServer(ServerConfig cfg, sqlcas::bindings::http::ServiceContext& ctx);
        ~HttpServer();

        HttpServer(const HttpServer&) = delete;
        HttpServer& operator=(const HttpServer&) = delete;

        // Binds and listens. Port 0 picks a free port, see port().
        // Invalid for an unparsable host, Unavailable if the socket cannot
        // be set up (aux holds the system error value).
        [[nodiscard]] sqlcas::core::Status listen(std::string* detail) noexcept;

        [[nodiscard]] u16 port() const noexcept;

        // Accepts until stop() or SIGINT/SIGTERM, then waits for open
        // connections to finish.
        [[nodiscard]] sqlcas::core::Status run() noexcept;

        // Safe from any thread.
        void stop() noexcept;

    private:
        using Socket = boost::asio::ip::tcp::socket;

        void do_accept();
        void start_session(Socket socket);
        void serve_session(Socket& socket);
        void end_session(const std::shared_ptr<Socket>& socket);

        ServerConfig cfg_;
        sqlcas::bindings::http::ServiceContext& ctx_;
        boost::asio::io_context ioc_;
        boost::asio::ip::tcp::acceptor acceptor_;

        std::mutex sessions_mutex_;  // guards sessions_
        std::condition_variable sessions_cv_;
        std::set<std::shared_ptr<Socket>> sessions_;
    };

} // namespace sqlcas::server
