/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <solkit/codec/base58.hpp>
#include "errors.hpp"
#include "key-manager.hpp"

namespace solkit::core {
    using namespace crypto;

    key_manager_t::key_manager_t(random::source_t &rnd):
        _rnd { rnd }
    {
    }

    key_pair_t key_manager_t::generate() const
    {
        return ed25519::create(_rnd);
    }

    key_pair_t key_manager_t::parse_secret(const std::string_view encoded)
    {
        uint8_vector bytes;
        try {
            bytes = codec::base58::decode(encoded);
        } catch (const err_invalid_encoding_t &) {
            // the decoder's message quotes the offending character, which must not leak from a secret
            throw err_invalid_secret_encoding_t { "secret: not a valid base58 string" };
        }
        ed25519::skey_t sk {};
        const auto sz = bytes.size();
        if (sz == sk.size())
            memcpy(sk.data(), bytes.data(), sk.size());
        secure_clear(bytes);
        if (sz != sk.size()) [[unlikely]]
            throw err_invalid_secret_length_t { fmt::format("secret: expected {} bytes but got {}", sk.size(), sz) };

        static constexpr size_t seed_size = sizeof(ed25519::seed_t);
        const ed25519::seed_t seed { buffer { sk }.subbuf(0, seed_size) };
        auto kp = ed25519::create_from_seed(seed);
        if (buffer { kp.vk } != buffer { sk }.subbuf(seed_size)) [[unlikely]]
            throw err_invalid_keypair_t { "secret: the public key half does not match the one derived from the seed" };
        return kp;
    }

    std::string key_manager_t::encode_secret(const key_pair_t &kp)
    {
        return codec::base58::encode(kp.sk);
    }

    std::string key_manager_t::encode_public(const key_pair_t &kp)
    {
        return codec::base58::encode(kp.vk);
    }
}
