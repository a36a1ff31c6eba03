/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <csignal>
#include <exception>
#include <vector>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <solkit/common/logger.hpp>
#include <solkit/common/numeric-cast.hpp>
#include "server.hpp"

namespace solkit::http {
    namespace asio = boost::asio;
    namespace beast = boost::beast;
    using tcp = asio::ip::tcp;

    namespace {
        std::string_view to_sv(const beast::string_view sv)
        {
            return { sv.data(), sv.size() };
        }

        std::string endpoint_str(const tcp::endpoint &ep)
        {
            return fmt::format("{}:{}", ep.address().to_string(), ep.port());
        }

        void log_coro_errors(const std::exception_ptr ptr)
        {
            if (ptr)
                logger::run_log_errors([&] { std::rethrow_exception(ptr); });
        }
    }

    bool accept_error_is_transient(const boost::system::error_code &ec)
    {
        return ec != asio::error::operation_aborted && ec != asio::error::bad_descriptor;
    }

    struct server_t::impl_t {
        impl_t(const router_t &router, server_config_t cfg):
            _router { router },
            _cfg { std::move(cfg) },
            _ioc { numeric_cast<int>(_cfg.num_threads) },
            _acceptor { _ioc, tcp::endpoint { asio::ip::make_address(_cfg.host), _cfg.port } }
        {
            if (_cfg.num_threads == 0) [[unlikely]]
                throw error("the number of server threads must be positive");
        }

        void run()
        {
            logger::info("listening on http://{} with {} worker thread(s)", endpoint_str(_acceptor.local_endpoint()), _cfg.num_threads);
            asio::signal_set signals { _ioc, SIGINT, SIGTERM };
            signals.async_wait([this](const boost::system::error_code &ec, const int sig) {
                if (!ec) {
                    logger::info("received signal {}, shutting down", sig);
                    stop();
                }
            });
            asio::co_spawn(_ioc, _listen(), [](const std::exception_ptr ptr) { log_coro_errors(ptr); });
            std::vector<std::thread> workers {};
            workers.reserve(_cfg.num_threads - 1);
            for (size_t i = 1; i < _cfg.num_threads; ++i)
                workers.emplace_back([this] { _ioc.run(); });
            _ioc.run();
            for (auto &w: workers)
                w.join();
            logger::info("the server has stopped");
        }

        void stop()
        {
            _ioc.stop();
        }

        uint16_t port() const
        {
            return _acceptor.local_endpoint().port();
        }
    private:
        const router_t &_router;
        const server_config_t _cfg;
        asio::io_context _ioc;
        tcp::acceptor _acceptor;

        asio::awaitable<void> _listen()
        {
            for (;;) {
                bool backoff = false;
                try {
                    auto sock = co_await _acceptor.async_accept(asio::make_strand(_ioc), asio::use_awaitable);
                    const auto ex = sock.get_executor();
                    asio::co_spawn(ex, _serve(std::move(sock)), [](const std::exception_ptr ptr) { log_coro_errors(ptr); });
                } catch (const boost::system::system_error &ex) {
                    if (!accept_error_is_transient(ex.code()))
                        throw;
                    logger::warn("accept failed: {}, retrying", ex.code().message());
                    backoff = true;
                }
                // out of file descriptors and similar conditions clear up only after some connections close
                if (backoff) {
                    asio::steady_timer timer { _ioc, std::chrono::milliseconds { 100 } };
                    co_await timer.async_wait(asio::use_awaitable);
                }
            }
        }

        asio::awaitable<void> _serve(tcp::socket sock)
        {
            const auto remote = endpoint_str(sock.remote_endpoint());
            logger::debug("{}: connected", remote);
            beast::tcp_stream stream { std::move(sock) };
            beast::flat_buffer buf {};
            try {
                for (;;) {
                    beast::http::request_parser<beast::http::string_body> parser {};
                    parser.body_limit(_cfg.max_body);
                    stream.expires_after(std::chrono::seconds { 30 });
                    co_await beast::http::async_read(stream, buf, parser, asio::use_awaitable);
                    const auto req = parser.release();
                    auto res = _router.handle(to_sv(req.method_string()), to_sv(req.target()), req.body());
                    logger::debug("{}: {} {} -> {}", remote, to_sv(req.method_string()), to_sv(req.target()), res.status);
                    beast::http::response<beast::http::string_body> resp { static_cast<beast::http::status>(res.status), req.version() };
                    resp.set(beast::http::field::server, "solkit");
                    resp.set(beast::http::field::content_type, "application/json");
                    resp.keep_alive(req.keep_alive());
                    resp.body() = std::move(res.body);
                    resp.prepare_payload();
                    co_await beast::http::async_write(stream, resp, asio::use_awaitable);
                    if (!resp.keep_alive())
                        break;
                }
            } catch (const boost::system::system_error &ex) {
                if (ex.code() != beast::http::error::end_of_stream)
                    logger::debug("{}: connection error: {}", remote, ex.code().message());
            }
            boost::system::error_code ec {};
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
            logger::debug("{}: closed", remote);
        }
    };

    server_t::server_t(const router_t &router, server_config_t cfg):
        _impl { std::make_unique<impl_t>(router, std::move(cfg)) }
    {
    }

    server_t::~server_t() =default;

    void server_t::run()
    {
        _impl->run();
    }

    void server_t::stop()
    {
        _impl->stop();
    }

    uint16_t server_t::port() const
    {
        return _impl->port();
    }
}
