#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "types.hpp"

namespace solkit::ledger::system {
    enum class instruction_type_t: uint32_t {
        create_account = 0,
        assign = 1,
        transfer = 2
    };

    extern instruction_t transfer(const pubkey_t &from, const pubkey_t &to, uint64_t lamports);
}
