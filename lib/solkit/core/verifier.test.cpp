/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <solkit/codec/base58.hpp>
#include <solkit/codec/base64.hpp>
#include <solkit/common/test.hpp>
#include "errors.hpp"
#include "signer.hpp"
#include "verifier.hpp"

namespace {
    using namespace solkit;
    using namespace solkit::core;
}

suite solkit_core_verifier_suite = [] {
    "solkit::core::verifier"_test = [] {
        const key_manager_t km { crypto::random::system_source() };
        const signer_t signer {};
        const verifier_t verifier {};
        const auto kp = km.generate();
        const std::string_view msg { "Hello, Solana!" };

        "sign is deterministic"_test = [&] {
            expect_equal(signer.sign(msg, kp), signer.sign(msg, kp));
            expect(signer.sign(msg, kp) != signer.sign(std::string_view { "Hello, Solana?" }, kp));
        };
        "sign then verify"_test = [&] {
            for (const std::string_view m: { std::string_view {}, msg, std::string_view { "\x00\x01\xff", 3 } }) {
                const auto sig = signer.sign(m, kp);
                expect(verifier.verify(m, sig, kp.vk));
            }
        };
        "mismatches are false"_test = [&] {
            const auto sig = signer.sign(msg, kp);
            expect(!verifier.verify(std::string_view { "another message" }, sig, kp.vk));
            expect(!verifier.verify(msg, sig, km.generate().vk));
            auto bad_sig = sig;
            bad_sig[0] ^= 0x80;
            expect(!verifier.verify(msg, bad_sig, kp.vk));
        };
        "length errors"_test = [&] {
            const auto sig = signer.sign(msg, kp);
            expect(throws<err_invalid_public_key_length_t>([&] { (void)verifier.verify(msg, sig, uint8_vector(31)); }));
            expect(throws<err_invalid_public_key_length_t>([&] { (void)verifier.verify(msg, sig, uint8_vector(33)); }));
            expect(throws<err_invalid_signature_length_t>([&] { (void)verifier.verify(msg, uint8_vector(63), kp.vk); }));
            expect(throws<err_invalid_signature_length_t>([&] { (void)verifier.verify(msg, uint8_vector {}, kp.vk); }));
            // the public key is checked first
            expect(throws<err_invalid_public_key_length_t>([&] { (void)verifier.verify(msg, uint8_vector(1), uint8_vector(1)); }));
        };
        "encoded inputs"_test = [&] {
            const auto sig_b64 = codec::base64::encode(signer.sign(msg, kp));
            const auto pk_b58 = key_manager_t::encode_public(kp);
            expect(verifier.verify_encoded(msg, sig_b64, pk_b58));
            expect(!verifier.verify_encoded(std::string_view { "tampered" }, sig_b64, pk_b58));
            expect(throws<err_invalid_encoding_t>([&] { (void)verifier.verify_encoded(msg, "@@@@", pk_b58); }));
            expect(throws<err_invalid_encoding_t>([&] { (void)verifier.verify_encoded(msg, sig_b64, "0OIl"); }));
            expect(throws<err_invalid_signature_length_t>([&] { (void)verifier.verify_encoded(msg, codec::base64::encode(uint8_vector(32)), pk_b58); }));
            expect(throws<err_invalid_public_key_length_t>([&] { (void)verifier.verify_encoded(msg, sig_b64, codec::base58::encode(uint8_vector(31))); }));
        };
    };
};
