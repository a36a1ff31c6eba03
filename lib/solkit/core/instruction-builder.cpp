/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <solkit/codec/base58.hpp>
#include <solkit/codec/base64.hpp>
#include <solkit/ledger/system.hpp>
#include <solkit/ledger/token.hpp>
#include "errors.hpp"
#include "instruction-builder.hpp"

namespace solkit::core {
    instruction_record_t instruction_record_t::from(const ledger::instruction_t &ix)
    {
        instruction_record_t rec { ix.program_id.to_base58() };
        rec.accounts.reserve(ix.accounts.size());
        for (const auto &acc: ix.accounts)
            rec.accounts.emplace_back(account_record_t { acc.pubkey.to_base58(), acc.is_signer, acc.is_writable });
        rec.data = codec::base64::encode(ix.data);
        return rec;
    }

    ledger::pubkey_t parse_address(const std::string_view text, const std::string_view field)
    {
        try {
            return ledger::pubkey_t::from_base58(text, field);
        } catch (const err_invalid_encoding_t &ex) {
            throw err_invalid_address_t { ex.what() };
        }
    }

    instruction_builder_t::instruction_builder_t(const ledger::pubkey_t &token_program):
        _token_program { token_program }
    {
    }

    instruction_record_t instruction_builder_t::build_initialize_mint(const std::string_view mint, const std::string_view mint_authority, const uint8_t decimals) const
    {
        const auto mint_pk = parse_address(mint, "mint");
        const auto authority_pk = parse_address(mint_authority, "mintAuthority");
        return instruction_record_t::from(ledger::token::initialize_mint(_token_program, mint_pk, authority_pk, {}, decimals));
    }

    instruction_record_t instruction_builder_t::build_mint_to(const std::string_view mint, const std::string_view destination, const std::string_view authority, const uint64_t amount) const
    {
        const auto mint_pk = parse_address(mint, "mint");
        const auto destination_pk = parse_address(destination, "destination");
        const auto authority_pk = parse_address(authority, "authority");
        return instruction_record_t::from(ledger::token::mint_to(_token_program, mint_pk, destination_pk, authority_pk, {}, amount));
    }

    instruction_record_t instruction_builder_t::build_transfer_native(const std::string_view from, const std::string_view to, const uint64_t lamports) const
    {
        const auto from_pk = parse_address(from, "from");
        const auto to_pk = parse_address(to, "to");
        return instruction_record_t::from(ledger::system::transfer(from_pk, to_pk, lamports));
    }

    instruction_record_t instruction_builder_t::build_transfer_token(const std::string_view destination, const std::string_view mint, const std::string_view owner, const uint64_t amount) const
    {
        const auto destination_pk = parse_address(destination, "destination");
        parse_address(mint, "mint");
        const auto owner_pk = parse_address(owner, "owner");
        return instruction_record_t::from(ledger::token::transfer(_token_program, owner_pk, destination_pk, owner_pk, {}, amount));
    }
}
