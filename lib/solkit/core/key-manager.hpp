#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <solkit/crypto/ed25519.hpp>

namespace solkit::core {
    using key_pair_t = crypto::ed25519::key_pair_t;

    struct key_manager_t {
        explicit key_manager_t(crypto::random::source_t &rnd);

        // Each call consumes fresh randomness from the source passed to the constructor
        [[nodiscard]] key_pair_t generate() const;

        // Parses the base58 text of the 64-byte seed‖public key layout.
        // Throws err_invalid_secret_encoding_t, err_invalid_secret_length_t or err_invalid_keypair_t.
        [[nodiscard]] static key_pair_t parse_secret(std::string_view encoded);

        [[nodiscard]] static std::string encode_secret(const key_pair_t &kp);
        [[nodiscard]] static std::string encode_public(const key_pair_t &kp);
    private:
        crypto::random::source_t &_rnd;
    };
}
