#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdlib>
#include <solkit/common/error.hpp>

namespace solkit::crypto::sodium
{
    typedef solkit::error error;

    extern "C" {
#       include <sodium.h>
    }

    // safe to call from any thread, initializes libsodium exactly once
    extern void ensure_initialized();
}
