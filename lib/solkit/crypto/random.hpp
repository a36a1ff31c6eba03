#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <solkit/common/bytes.hpp>

namespace solkit::crypto::random {
    // A source of random bytes handed to the components that need one.
    // Implementations must be safe to call from multiple threads.
    struct source_t {
        virtual ~source_t() =default;
        virtual void fill(write_buffer out) =0;
    };

    // The operating system's CSPRNG as exposed by libsodium's randombytes_buf
    struct system_source_t: source_t {
        explicit system_source_t();
        void fill(write_buffer out) override;
    };

    // a process-wide instance for the production wiring in main and the CLI commands
    extern source_t &system_source();
}
