#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <memory>
#include <thread>
#include <boost/system/error_code.hpp>
#include "router.hpp"

namespace solkit::http {
    struct server_config_t {
        std::string host = "0.0.0.0";
        // 0 lets the operating system pick a free port
        uint16_t port = 3000;
        size_t num_threads = std::max(std::thread::hardware_concurrency(), 1U);
        size_t max_body = 0x10000;
    };

    // false once the acceptor has been closed or cancelled, true for errors such as EMFILE the accept loop survives
    [[nodiscard]] extern bool accept_error_is_transient(const boost::system::error_code &ec);

    // HTTP/1.1 server with one coroutine per connection over a shared io_context
    struct server_t {
        // binds the listening socket, so port() is valid right after construction
        server_t(const router_t &router, server_config_t cfg);
        ~server_t();

        // blocks until stop() is called or the process receives SIGINT or SIGTERM
        void run();
        void stop();
        [[nodiscard]] uint16_t port() const;
    private:
        struct impl_t;
        std::unique_ptr<impl_t> _impl;
    };
}
