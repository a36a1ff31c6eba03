/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <solkit/core/errors.hpp>
#include <solkit/crypto/sodium.hpp>
#include "base64.hpp"

namespace solkit::codec::base64 {
    using namespace crypto::sodium;

    static constexpr int variant = sodium_base64_VARIANT_ORIGINAL;

    std::string encode(const buffer bytes)
    {
        ensure_initialized();
        // the encoded length reported by libsodium includes the terminating zero
        std::string res(sodium_base64_encoded_len(bytes.size(), variant), '\0');
        sodium_bin2base64(res.data(), res.size(), bytes.data(), bytes.size(), variant);
        res.resize(res.size() - 1);
        return res;
    }

    uint8_vector decode(const std::string_view text)
    {
        ensure_initialized();
        if (text.size() % 4 != 0) [[unlikely]]
            throw core::err_invalid_encoding_t { fmt::format("base64 string length must be a multiple of 4 but got {}", text.size()) };
        uint8_vector res(text.size() / 4 * 3);
        size_t res_len = 0;
        const char *end = nullptr;
        if (sodium_base642bin(res.data(), res.size(), text.data(), text.size(), nullptr, &res_len, &end, variant) != 0) [[unlikely]]
            throw core::err_invalid_encoding_t { "invalid base64 string: bad character or padding" };
        if (end != text.data() + text.size()) [[unlikely]]
            throw core::err_invalid_encoding_t { fmt::format("invalid base64 string: unexpected character at position {}", end - text.data()) };
        res.resize(res_len);
        return res;
    }
}
