#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <solkit/common/bytes.hpp>

namespace solkit::codec::base64 {
    // RFC 4648 standard alphabet with mandatory padding
    extern std::string encode(buffer bytes);
    extern uint8_vector decode(std::string_view text);
}
