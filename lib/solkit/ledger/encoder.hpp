#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <solkit/common/bytes.hpp>

namespace solkit::ledger {
    // Little-endian fixed-width encoding used by the native programs' instruction data
    struct encoder {
        void uint_trivial(const size_t num_bytes, const uint64_t val)
        {
            auto x = val;
            for (size_t i = 0; i < num_bytes; ++i) {
                _bytes.emplace_back(static_cast<uint8_t>(x & 0xFF));
                x >>= 8;
            }
            if (x) [[unlikely]]
                throw error(fmt::format("{} cannot be encoded as a sequence of {} bytes", val, num_bytes));
        }

        void next_bytes(const buffer bytes)
        {
            _bytes << bytes;
        }

        const uint8_vector &bytes() const noexcept
        {
            return _bytes;
        }

        uint8_vector release() noexcept
        {
            return std::move(_bytes);
        }
    private:
        uint8_vector _bytes {};
    };
}
