#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <solkit/ledger/types.hpp>

namespace solkit::core {
    struct account_record_t {
        std::string pubkey;
        bool is_signer = false;
        bool is_writable = false;

        bool operator==(const account_record_t &o) const =default;
    };

    // The transport form of an instruction: base58 addresses and base64 data
    struct instruction_record_t {
        std::string program_id;
        std::vector<account_record_t> accounts {};
        std::string data {};

        static instruction_record_t from(const ledger::instruction_t &ix);
    };

    // Throws err_invalid_address_t naming the field unless text is the base58 form of exactly 32 bytes
    extern ledger::pubkey_t parse_address(std::string_view text, std::string_view field);

    struct instruction_builder_t {
        explicit instruction_builder_t(const ledger::pubkey_t &token_program=ledger::program_ids::token());

        // The freeze authority is always absent
        [[nodiscard]] instruction_record_t build_initialize_mint(std::string_view mint, std::string_view mint_authority, uint8_t decimals) const;
        [[nodiscard]] instruction_record_t build_mint_to(std::string_view mint, std::string_view destination, std::string_view authority, uint64_t amount) const;
        [[nodiscard]] instruction_record_t build_transfer_native(std::string_view from, std::string_view to, uint64_t lamports) const;
        // The owner acts both as the source account and as the signing authority.
        // The mint is validated but the transfer instruction does not reference it.
        [[nodiscard]] instruction_record_t build_transfer_token(std::string_view destination, std::string_view mint, std::string_view owner, uint64_t amount) const;
    private:
        ledger::pubkey_t _token_program;
    };
}
