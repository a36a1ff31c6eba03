#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "types.hpp"

namespace solkit::ledger::token {
    static constexpr size_t max_signers = 11;

    enum class instruction_type_t: uint8_t {
        initialize_mint = 0,
        initialize_account = 1,
        initialize_multisig = 2,
        transfer = 3,
        approve = 4,
        revoke = 5,
        set_authority = 6,
        mint_to = 7
    };

    using signer_list_t = std::vector<pubkey_t>;

    // Throws core::err_instruction_construction_t unless program is one of the token programs
    extern void check_program(const pubkey_t &program);

    extern instruction_t initialize_mint(const pubkey_t &program, const pubkey_t &mint, const pubkey_t &mint_authority,
        const optional_pubkey_t &freeze_authority, uint8_t decimals);
    extern instruction_t mint_to(const pubkey_t &program, const pubkey_t &mint, const pubkey_t &destination,
        const pubkey_t &authority, const signer_list_t &signers, uint64_t amount);
    extern instruction_t transfer(const pubkey_t &program, const pubkey_t &source, const pubkey_t &destination,
        const pubkey_t &authority, const signer_list_t &signers, uint64_t amount);
}
