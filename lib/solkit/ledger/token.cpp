/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <solkit/core/errors.hpp>
#include "encoder.hpp"
#include "token.hpp"

namespace solkit::ledger::token {
    namespace {
        void append_authority(std::vector<account_meta_t> &accounts, const pubkey_t &authority, const signer_list_t &signers)
        {
            if (signers.size() > max_signers) [[unlikely]]
                throw core::err_instruction_construction_t { fmt::format("signers: at most {} co-signers are allowed but got {}", max_signers, signers.size()) };
            accounts.emplace_back(account_meta_t::readonly(authority, signers.empty()));
            for (const auto &s: signers)
                accounts.emplace_back(account_meta_t::readonly(s, true));
        }

        uint8_vector amount_data(const instruction_type_t type, const uint64_t amount)
        {
            encoder enc {};
            enc.uint_trivial(1, static_cast<uint8_t>(type));
            enc.uint_trivial(8, amount);
            return enc.release();
        }
    }

    void check_program(const pubkey_t &program)
    {
        if (program != program_ids::token() && program != program_ids::token_2022()) [[unlikely]]
            throw core::err_instruction_construction_t { fmt::format("program_id: {} is not a token program", program) };
    }

    instruction_t initialize_mint(const pubkey_t &program, const pubkey_t &mint, const pubkey_t &mint_authority,
        const optional_pubkey_t &freeze_authority, const uint8_t decimals)
    {
        check_program(program);
        encoder enc {};
        enc.uint_trivial(1, static_cast<uint8_t>(instruction_type_t::initialize_mint));
        enc.uint_trivial(1, decimals);
        enc.next_bytes(mint_authority);
        if (freeze_authority) {
            enc.uint_trivial(1, 1);
            enc.next_bytes(*freeze_authority);
        } else {
            enc.uint_trivial(1, 0);
        }
        return {
            program,
            {
                account_meta_t::writable(mint, false),
                account_meta_t::readonly(sysvars::rent(), false)
            },
            enc.release()
        };
    }

    instruction_t mint_to(const pubkey_t &program, const pubkey_t &mint, const pubkey_t &destination,
        const pubkey_t &authority, const signer_list_t &signers, const uint64_t amount)
    {
        check_program(program);
        instruction_t ix { program };
        ix.accounts.emplace_back(account_meta_t::writable(mint, false));
        ix.accounts.emplace_back(account_meta_t::writable(destination, false));
        append_authority(ix.accounts, authority, signers);
        ix.data = amount_data(instruction_type_t::mint_to, amount);
        return ix;
    }

    instruction_t transfer(const pubkey_t &program, const pubkey_t &source, const pubkey_t &destination,
        const pubkey_t &authority, const signer_list_t &signers, const uint64_t amount)
    {
        check_program(program);
        instruction_t ix { program };
        ix.accounts.emplace_back(account_meta_t::writable(source, false));
        ix.accounts.emplace_back(account_meta_t::writable(destination, false));
        append_authority(ix.accounts, authority, signers);
        ix.data = amount_data(instruction_type_t::transfer, amount);
        return ix;
    }
}
