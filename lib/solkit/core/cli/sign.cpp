/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include <solkit/codec/base64.hpp>
#include <solkit/common/cli.hpp>
#include <solkit/core/signer.hpp>

namespace solkit::cli::sign {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "sign";
            cmd.desc = "Sign <message> with the base58-encoded 64-byte <secret> and print the base64 signature";
            cmd.args.expect({ "<secret>", "<message>" });
        }

        void run(const arguments &args) const override
        {
            const auto kp = core::key_manager_t::parse_secret(args.at(0));
            const auto sig = core::signer_t {}.sign(args.at(1), kp);
            std::cout << codec::base64::encode(sig) << '\n';
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
