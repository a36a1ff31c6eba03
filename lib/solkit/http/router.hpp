#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <solkit/codec/json.hpp>
#include <solkit/core/instruction-builder.hpp>
#include <solkit/core/key-manager.hpp>
#include <solkit/core/signer.hpp>
#include <solkit/core/verifier.hpp>

namespace solkit::http {
    namespace json = codec::json;

    struct response_t {
        unsigned status = 200;
        std::string body {};
    };

    // Maps a POST request onto exactly one core operation and renders the result as a JSON envelope.
    // Holds no mutable state and may be shared between threads.
    struct router_t {
        explicit router_t(crypto::random::source_t &rnd, const ledger::pubkey_t &token_program=ledger::program_ids::token());

        [[nodiscard]] response_t handle(std::string_view method, std::string_view target, std::string_view body) const;
    private:
        using handler_t = json::value (router_t::*)(const json::object &) const;
        static const std::map<std::string, handler_t, std::less<>> &routes();

        core::key_manager_t _keys;
        core::signer_t _signer {};
        core::verifier_t _verifier {};
        core::instruction_builder_t _builder;

        json::value _keypair(const json::object &req) const;
        json::value _token_create(const json::object &req) const;
        json::value _token_mint(const json::object &req) const;
        json::value _message_sign(const json::object &req) const;
        json::value _message_verify(const json::object &req) const;
        json::value _send_sol(const json::object &req) const;
        json::value _send_token(const json::object &req) const;
    };
}
