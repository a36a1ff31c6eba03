/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include <solkit/common/cli.hpp>
#include <solkit/core/verifier.hpp>

namespace solkit::cli::verify {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "verify";
            cmd.desc = "Check the base64 <signature> of <message> against the base58 <pubkey> and print valid or invalid";
            cmd.args.expect({ "<pubkey>", "<signature>", "<message>" });
        }

        void run(const arguments &args) const override
        {
            const auto valid = core::verifier_t {}.verify_encoded(args.at(2), args.at(1), args.at(0));
            std::cout << (valid ? "valid" : "invalid") << '\n';
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
