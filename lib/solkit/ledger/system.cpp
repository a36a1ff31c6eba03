/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "encoder.hpp"
#include "system.hpp"

namespace solkit::ledger::system {
    instruction_t transfer(const pubkey_t &from, const pubkey_t &to, const uint64_t lamports)
    {
        encoder enc {};
        enc.uint_trivial(4, static_cast<uint32_t>(instruction_type_t::transfer));
        enc.uint_trivial(8, lamports);
        return {
            program_ids::system(),
            {
                account_meta_t::writable(from, true),
                account_meta_t::writable(to, false)
            },
            enc.release()
        };
    }
}
