#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <solkit/common/bytes.hpp>

namespace solkit::codec::base58 {
    // inputs longer than this are rejected before any arithmetic is done
    static constexpr size_t max_encoded_size = 128;

    extern std::string encode(buffer bytes);
    extern uint8_vector decode(std::string_view text);

    // field is the name of the input reported in error messages
    extern void decode_fixed(write_buffer out, std::string_view text, std::string_view field);

    template<typename T>
    T decode_fixed(const std::string_view text, const std::string_view field)
    {
        T res;
        decode_fixed(res, text, field);
        return res;
    }
}
