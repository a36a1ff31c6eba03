/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include <solkit/common/cli.hpp>
#include <solkit/core/key-manager.hpp>

namespace solkit::cli::keypair {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "keypair";
            cmd.desc = "Generate a fresh Ed25519 key pair and print its base58 public key and secret";
        }

        void run(const arguments &) const override
        {
            const core::key_manager_t km { crypto::random::system_source() };
            const auto kp = km.generate();
            // stdout only, the logger must not see secrets
            std::cout << fmt::format("pubkey: {}\nsecret: {}\n", core::key_manager_t::encode_public(kp), core::key_manager_t::encode_secret(kp));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
