#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <solkit/common/bytes.hpp>

namespace solkit::core {
    struct verifier_t {
        // Length violations throw err_invalid_public_key_length_t (checked first) or err_invalid_signature_length_t.
        // A signature that does not match returns false.
        [[nodiscard]] bool verify(const buffer &msg, const buffer &sig, const buffer &pk) const;

        // sig is base64 and pk is base58, decoding failures throw err_invalid_encoding_t naming the field
        [[nodiscard]] bool verify_encoded(const buffer &msg, std::string_view sig, std::string_view pk) const;
    };
}
