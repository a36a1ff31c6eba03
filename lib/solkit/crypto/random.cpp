/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "random.hpp"
#include "sodium.hpp"

namespace solkit::crypto::random {
    system_source_t::system_source_t()
    {
        sodium::ensure_initialized();
    }

    void system_source_t::fill(const write_buffer out)
    {
        sodium::randombytes_buf(out.data(), out.size());
    }

    source_t &system_source()
    {
        static system_source_t src {};
        return src;
    }
}
