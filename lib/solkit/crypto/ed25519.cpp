/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "ed25519.hpp"
#include "sodium.hpp"

namespace solkit::crypto::ed25519 {
    static_assert(sizeof(skey_t) == crypto_sign_SECRETKEYBYTES);
    static_assert(sizeof(seed_t) == crypto_sign_SEEDBYTES);
    static_assert(sizeof(vkey_t) == crypto_sign_PUBLICKEYBYTES);
    static_assert(sizeof(signature_t) == crypto_sign_BYTES);

    key_pair_t create_from_seed(const seed_t &sd)
    {
        sodium::ensure_initialized();
        key_pair_t res;
        if (sodium::crypto_sign_seed_keypair(res.vk.data(), res.sk.data(), sd.data()) != 0)
            throw error("failed to generate a cryptographic key pair!");
        return res;
    }

    key_pair_t create(random::source_t &rnd)
    {
        seed_t sd;
        rnd.fill(sd);
        return create_from_seed(sd);
    }

    signature_t sign(const buffer &msg, const skey_t &sk)
    {
        sodium::ensure_initialized();
        signature_t sig;
        unsigned long long sig_len = 0;
        if (sodium::crypto_sign_detached(sig.data(), &sig_len, msg.data(), msg.size(), sk.data()) != 0 || sig_len != sig.size()) [[unlikely]]
            throw error("failed to sign a message!");
        return sig;
    }

    bool verify(const signature_t &sig, const buffer &msg, const vkey_t &vk)
    {
        sodium::ensure_initialized();
        return sodium::crypto_sign_verify_detached(sig.data(), msg.data(), msg.size(), vk.data()) == 0;
    }
}
