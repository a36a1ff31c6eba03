/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <solkit/codec/base58.hpp>
#include <solkit/codec/base64.hpp>
#include <solkit/crypto/ed25519.hpp>
#include "errors.hpp"
#include "verifier.hpp"

namespace solkit::core {
    using namespace crypto;

    bool verifier_t::verify(const buffer &msg, const buffer &sig, const buffer &pk) const
    {
        if (pk.size() != sizeof(ed25519::vkey_t)) [[unlikely]]
            throw err_invalid_public_key_length_t { fmt::format("pubkey: expected {} bytes but got {}", sizeof(ed25519::vkey_t), pk.size()) };
        if (sig.size() != sizeof(ed25519::signature_t)) [[unlikely]]
            throw err_invalid_signature_length_t { fmt::format("signature: expected {} bytes but got {}", sizeof(ed25519::signature_t), sig.size()) };
        return ed25519::verify(ed25519::signature_t { sig }, msg, ed25519::vkey_t { pk });
    }

    bool verifier_t::verify_encoded(const buffer &msg, const std::string_view sig, const std::string_view pk) const
    {
        uint8_vector pk_bytes;
        try {
            pk_bytes = codec::base58::decode(pk);
        } catch (const err_invalid_encoding_t &ex) {
            throw err_invalid_encoding_t { fmt::format("pubkey: {}", ex.what()) };
        }
        uint8_vector sig_bytes;
        try {
            sig_bytes = codec::base64::decode(sig);
        } catch (const err_invalid_encoding_t &ex) {
            throw err_invalid_encoding_t { fmt::format("signature: {}", ex.what()) };
        }
        return verify(msg, sig_bytes, pk_bytes);
    }
}
