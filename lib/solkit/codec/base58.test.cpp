/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <random>
#include <solkit/common/test.hpp>
#include <solkit/core/errors.hpp>
#include "base58.hpp"

namespace {
    using namespace solkit;
    using namespace solkit::codec;
}

suite solkit_codec_base58_suite = [] {
    "solkit::codec::base58"_test = [] {
        "encode"_test = [] {
            expect_equal(std::string {}, base58::encode(uint8_vector {}));
            expect_equal(std::string { "1" }, base58::encode(uint8_vector::from_hex("00")));
            expect_equal(std::string { "1112" }, base58::encode(uint8_vector::from_hex("00000001")));
            expect_equal(std::string { "2" }, base58::encode(uint8_vector::from_hex("01")));
            expect_equal(std::string { "z" }, base58::encode(uint8_vector::from_hex("39")));
            expect_equal(std::string { "21" }, base58::encode(uint8_vector::from_hex("3A")));
            expect_equal(std::string { "JxF12TrwUP45BMd" }, base58::encode(buffer { std::string_view { "Hello World" } }));
            expect_equal(std::string { "11111111111111111111111111111111" }, base58::encode(uint8_vector(32)));
        };
        "decode"_test = [] {
            expect_equal(uint8_vector {}, base58::decode(""));
            expect_equal(uint8_vector::from_hex("00"), base58::decode("1"));
            expect_equal(uint8_vector::from_hex("00000001"), base58::decode("1112"));
            expect_equal(std::string_view { "Hello World" }, base58::decode("JxF12TrwUP45BMd").str());
            expect_equal(size_t { 32 }, base58::decode("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA").size());
            expect_equal(uint8_vector(32), base58::decode("11111111111111111111111111111111"));
        };
        "excluded characters"_test = [] {
            for (const auto *bad: { "0", "O", "I", "l", "abc0", "2+", "abc def", "\xC3\xA9" }) {
                expect(throws<core::err_invalid_encoding_t>([&] { base58::decode(bad); })) << bad;
            }
        };
        "error messages are ascii"_test = [] {
            try {
                base58::decode("abc\xC3\xA9");
                expect(false);
            } catch (const core::err_invalid_encoding_t &ex) {
                expect_equal(std::string_view { "invalid base58 character 0xC3 at position 3" }, std::string_view { ex.what() });
            }
        };
        "too long"_test = [] {
            const std::string long_str(base58::max_encoded_size + 1, '2');
            expect(throws<core::err_invalid_encoding_t>([&] { base58::decode(long_str); }));
            const std::string max_str(base58::max_encoded_size, '2');
            expect(nothrow([&] { base58::decode(max_str); }));
        };
        "decode_fixed"_test = [] {
            const auto token = base58::decode_fixed<byte_array<32>>("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA", "program");
            expect_equal(std::string { "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA" }, base58::encode(token));
            expect(throws<core::err_invalid_encoding_t>([] { base58::decode_fixed<byte_array<32>>("2", "program"); }));
            try {
                base58::decode_fixed<byte_array<32>>("JxF12TrwUP45BMd", "mint");
                expect(false);
            } catch (const core::err_invalid_encoding_t &ex) {
                const std::string_view msg { ex.what() };
                expect(msg.starts_with("mint: ")) << msg;
            }
        };
        "round trip"_test = [] {
            std::mt19937 rng { 42 };
            for (size_t sz: { 1, 2, 31, 32, 33, 64 }) {
                uint8_vector data(sz);
                for (auto &b: data)
                    b = static_cast<uint8_t>(rng());
                data[0] = 0;
                expect_equal(data, base58::decode(base58::encode(data)));
            }
        };
    };
};
