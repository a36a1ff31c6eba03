/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <solkit/common/cli.hpp>
#include <solkit/http/server.hpp>

namespace solkit::cli::http_server {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "http-server";
            cmd.desc = "Serve the keypair, signing and instruction building API over HTTP until interrupted";
            cmd.opts.try_emplace("host", "the address to listen at", "0.0.0.0");
            cmd.opts.try_emplace("port", "the TCP port to listen at", "3000");
            cmd.opts.try_emplace("threads", "the number of worker threads", std::to_string(http::server_config_t {}.num_threads));
            cmd.opts.try_emplace("max-body", "the maximum size of a request body in bytes", "65536");
            cmd.opts.try_emplace("token-program", "the base58 id of the token program the instructions target", ledger::program_ids::token().to_base58());
        }

        void run(const arguments &, const options &opts) const override
        {
            const auto token_program = ledger::pubkey_t::from_base58(opts.at("token-program").value(), "token-program");
            const http::router_t router { crypto::random::system_source(), token_program };
            http::server_config_t cfg {};
            cfg.host = opts.at("host").value();
            cfg.port = from_str<uint16_t>(opts.at("port").value());
            cfg.num_threads = from_str<size_t>(opts.at("threads").value());
            cfg.max_body = from_str<size_t>(opts.at("max-body").value());
            logger::info("token program: {}", token_program);
            http::server_t srv { router, std::move(cfg) };
            srv.run();
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
