/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <solkit/core/errors.hpp>
#include "base58.hpp"

namespace solkit::codec::base58 {
    static constexpr std::string_view alphabet { "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz" };

    static constexpr std::array<int8_t, 128> make_index()
    {
        std::array<int8_t, 128> idx {};
        for (auto &v: idx)
            v = -1;
        for (size_t i = 0; i < alphabet.size(); ++i)
            idx[static_cast<uint8_t>(alphabet[i])] = static_cast<int8_t>(i);
        return idx;
    }

    static constexpr auto alphabet_index = make_index();

    std::string encode(const buffer bytes)
    {
        size_t zeros = 0;
        while (zeros < bytes.size() && bytes[zeros] == 0)
            ++zeros;
        // log(256) / log(58) ~= 1.37
        std::vector<uint8_t> digits((bytes.size() - zeros) * 138 / 100 + 1);
        size_t digits_len = 0;
        for (size_t i = zeros; i < bytes.size(); ++i) {
            uint32_t carry = bytes[i];
            for (size_t j = 0; j < digits_len; ++j) {
                carry += static_cast<uint32_t>(digits[j]) << 8;
                digits[j] = carry % 58;
                carry /= 58;
            }
            while (carry > 0) {
                digits[digits_len++] = carry % 58;
                carry /= 58;
            }
        }
        std::string res(zeros, '1');
        res.reserve(zeros + digits_len);
        for (size_t j = digits_len; j > 0; --j)
            res.push_back(alphabet[digits[j - 1]]);
        return res;
    }

    uint8_vector decode(const std::string_view text)
    {
        if (text.size() > max_encoded_size) [[unlikely]]
            throw core::err_invalid_encoding_t { fmt::format("base58 string is too long: {} characters, the maximum is {}", text.size(), max_encoded_size) };
        size_t ones = 0;
        while (ones < text.size() && text[ones] == '1')
            ++ones;
        // log(58) / log(256) ~= 0.733
        std::vector<uint8_t> bytes((text.size() - ones) * 733 / 1000 + 1);
        size_t bytes_len = 0;
        for (size_t i = ones; i < text.size(); ++i) {
            const auto c = static_cast<uint8_t>(text[i]);
            const int8_t digit = c < alphabet_index.size() ? alphabet_index[c] : -1;
            if (digit < 0) [[unlikely]]
                throw core::err_invalid_encoding_t { fmt::format("invalid base58 character 0x{:02X} at position {}", c, i) };
            uint32_t carry = static_cast<uint32_t>(digit);
            for (size_t j = 0; j < bytes_len; ++j) {
                carry += static_cast<uint32_t>(bytes[j]) * 58;
                bytes[j] = carry & 0xFF;
                carry >>= 8;
            }
            while (carry > 0) {
                bytes[bytes_len++] = carry & 0xFF;
                carry >>= 8;
            }
        }
        uint8_vector res(ones + bytes_len);
        for (size_t j = 0; j < bytes_len; ++j)
            res[ones + j] = bytes[bytes_len - 1 - j];
        return res;
    }

    void decode_fixed(const write_buffer out, const std::string_view text, const std::string_view field)
    {
        uint8_vector bytes {};
        try {
            bytes = decode(text);
        } catch (const core::err_invalid_encoding_t &ex) {
            throw core::err_invalid_encoding_t { fmt::format("{}: {}", field, ex.what()) };
        }
        if (bytes.size() != out.size()) [[unlikely]]
            throw core::err_invalid_encoding_t { fmt::format("{}: expected {} bytes but got {}", field, out.size(), bytes.size()) };
        std::copy(bytes.begin(), bytes.end(), out.begin());
        secure_clear(bytes);
    }
}
