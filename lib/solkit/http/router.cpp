/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <limits>
#include <solkit/codec/base64.hpp>
#include <solkit/common/logger.hpp>
#include <solkit/core/errors.hpp>
#include "router.hpp"

namespace solkit::http {
    namespace {
        std::string_view require_string(const json::object &req, const std::string_view name)
        {
            if (const auto val = json::get_string(req, name); val) [[likely]]
                return *val;
            throw core::err_invalid_request_t { fmt::format("Missing required fields: {}", name) };
        }

        uint64_t require_uint(const json::object &req, const std::string_view name, const uint64_t max=std::numeric_limits<uint64_t>::max())
        {
            if (const auto val = json::get_uint(req, name); val && *val <= max) [[likely]]
                return *val;
            throw core::err_invalid_request_t { fmt::format("Missing required fields: {}", name) };
        }

        json::object record_json(const core::instruction_record_t &rec)
        {
            json::array accounts {};
            for (const auto &acc: rec.accounts) {
                accounts.emplace_back(json::object {
                    { "pubkey", acc.pubkey },
                    { "is_signer", acc.is_signer },
                    { "is_writable", acc.is_writable }
                });
            }
            return json::object {
                { "program_id", rec.program_id },
                { "accounts", std::move(accounts) },
                { "instruction_data", rec.data }
            };
        }

        response_t success(json::value data)
        {
            return { 200, json::serialize(json::object { { "success", true }, { "data", std::move(data) } }) };
        }

        response_t failure(const unsigned status, const std::string_view msg)
        {
            return { status, json::serialize(json::object { { "success", false }, { "error", msg } }) };
        }
    }

    router_t::router_t(crypto::random::source_t &rnd, const ledger::pubkey_t &token_program):
        _keys { rnd },
        _builder { token_program }
    {
    }

    const std::map<std::string, router_t::handler_t, std::less<>> &router_t::routes()
    {
        static const std::map<std::string, handler_t, std::less<>> r {
            { "/keypair", &router_t::_keypair },
            { "/token/create", &router_t::_token_create },
            { "/token/mint", &router_t::_token_mint },
            { "/message/sign", &router_t::_message_sign },
            { "/message/verify", &router_t::_message_verify },
            { "/send/sol", &router_t::_send_sol },
            { "/send/token", &router_t::_send_token }
        };
        return r;
    }

    response_t router_t::handle(const std::string_view method, const std::string_view target, const std::string_view body) const
    {
        const auto path = target.substr(0, target.find('?'));
        const auto it = routes().find(path);
        if (it == routes().end()) [[unlikely]]
            return failure(404, fmt::format("Not found: {}", path));
        if (method != "POST") [[unlikely]]
            return failure(405, fmt::format("Method not allowed: {}", method));
        try {
            json::object req {};
            // the keypair route takes no parameters and ignores its body
            if (it->first != "/keypair") {
                json::value jv;
                try {
                    jv = json::parse(body);
                } catch (const error &ex) {
                    throw core::err_invalid_request_t { fmt::format("Missing required fields: {}", ex.what()) };
                }
                if (!jv.is_object()) [[unlikely]]
                    throw core::err_invalid_request_t { "Missing required fields: the request body must be a JSON object" };
                req = std::move(jv.get_object());
            }
            return success((this->*(it->second))(req));
        } catch (const core::api_error &ex) {
            logger::debug("{} {}: {}: {}", method, path, core::error_code_name(ex.code()), ex.what());
            return failure(400, ex.what());
        } catch (const std::exception &ex) {
            logger::error("{} {} failed: {}", method, path, ex.what());
            return failure(500, "Internal server error");
        }
    }

    json::value router_t::_keypair(const json::object &) const
    {
        const auto kp = _keys.generate();
        return json::object {
            { "pubkey", core::key_manager_t::encode_public(kp) },
            { "secret", core::key_manager_t::encode_secret(kp) }
        };
    }

    json::value router_t::_token_create(const json::object &req) const
    {
        const auto mint_authority = require_string(req, "mintAuthority");
        const auto mint = require_string(req, "mint");
        const auto decimals = require_uint(req, "decimals", std::numeric_limits<uint8_t>::max());
        return record_json(_builder.build_initialize_mint(mint, mint_authority, static_cast<uint8_t>(decimals)));
    }

    json::value router_t::_token_mint(const json::object &req) const
    {
        const auto mint = require_string(req, "mint");
        const auto destination = require_string(req, "destination");
        const auto authority = require_string(req, "authority");
        const auto amount = require_uint(req, "amount");
        return record_json(_builder.build_mint_to(mint, destination, authority, amount));
    }

    json::value router_t::_message_sign(const json::object &req) const
    {
        const auto message = require_string(req, "message");
        const auto secret = require_string(req, "secret");
        const auto kp = core::key_manager_t::parse_secret(secret);
        return json::object {
            { "signature", codec::base64::encode(_signer.sign(message, kp)) },
            { "public_key", core::key_manager_t::encode_public(kp) },
            { "message", message }
        };
    }

    json::value router_t::_message_verify(const json::object &req) const
    {
        const auto message = require_string(req, "message");
        const auto signature = require_string(req, "signature");
        const auto pubkey = require_string(req, "pubkey");
        return json::object {
            { "valid", _verifier.verify_encoded(message, signature, pubkey) },
            { "message", message },
            { "pubkey", pubkey }
        };
    }

    json::value router_t::_send_sol(const json::object &req) const
    {
        const auto from = require_string(req, "from");
        const auto to = require_string(req, "to");
        const auto lamports = require_uint(req, "lamports");
        const auto rec = _builder.build_transfer_native(from, to, lamports);
        json::array accounts {};
        for (const auto &acc: rec.accounts)
            accounts.emplace_back(acc.pubkey);
        return json::object {
            { "program_id", rec.program_id },
            { "accounts", std::move(accounts) },
            { "instruction_data", rec.data }
        };
    }

    json::value router_t::_send_token(const json::object &req) const
    {
        const auto destination = require_string(req, "destination");
        const auto mint = require_string(req, "mint");
        const auto owner = require_string(req, "owner");
        const auto amount = require_uint(req, "amount");
        const auto rec = _builder.build_transfer_token(destination, mint, owner, amount);
        json::array accounts {};
        for (const auto &acc: rec.accounts) {
            accounts.emplace_back(json::object {
                { "pubkey", acc.pubkey },
                { "isSigner", acc.is_signer }
            });
        }
        return json::object {
            { "program_id", rec.program_id },
            { "accounts", std::move(accounts) },
            { "instruction_data", rec.data }
        };
    }
}
