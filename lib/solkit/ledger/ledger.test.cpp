/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <solkit/common/test.hpp>
#include <solkit/core/errors.hpp>
#include "encoder.hpp"
#include "system.hpp"
#include "token.hpp"

namespace {
    using namespace solkit;
    using namespace solkit::ledger;

    pubkey_t make_key(const uint8_t fill)
    {
        pubkey_t pk;
        pk.fill(fill);
        return pk;
    }
}

suite solkit_ledger_suite = [] {
    "solkit::ledger"_test = [] {
        const auto a = make_key(0x11);
        const auto b = make_key(0x22);
        const auto c = make_key(0x33);

        "well-known ids"_test = [] {
            expect_equal(pubkey_t {}, program_ids::system());
            expect_equal(std::string { "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA" }, program_ids::token().to_base58());
            expect_equal(std::string { "TokenzQdBNbLqP5VEhdkAS6EPFLC1PHnBqCXEpPxuEb" }, program_ids::token_2022().to_base58());
            expect_equal(std::string { "SysvarRent111111111111111111111111111111111" }, sysvars::rent().to_base58());
        };
        "pubkey parse errors name the field"_test = [] {
            try {
                pubkey_t::from_base58("111", "mint");
                expect(false);
            } catch (const core::err_invalid_encoding_t &ex) {
                expect(std::string_view { ex.what() }.starts_with("mint: ")) << ex.what();
            }
        };
        "encoder"_test = [] {
            encoder enc {};
            enc.uint_trivial(4, 2);
            enc.uint_trivial(8, 0x0102030405060708ULL);
            expect_equal(uint8_vector::from_hex("020000000807060504030201"), enc.bytes());
            expect(throws<error>([&] { enc.uint_trivial(1, 0x100); }));
        };
        "system transfer"_test = [&] {
            const auto ix = system::transfer(a, b, 1'000'000);
            expect_equal(program_ids::system(), ix.program_id);
            expect_equal(size_t { 2 }, ix.accounts.size());
            expect(ix.accounts.at(0) == account_meta_t { a, true, true });
            expect(ix.accounts.at(1) == account_meta_t { b, false, true });
            expect_equal(uint8_vector::from_hex("0200000040420f0000000000"), ix.data);
        };
        "initialize mint"_test = [&] {
            const auto ix = token::initialize_mint(program_ids::token(), a, b, {}, 9);
            expect_equal(program_ids::token(), ix.program_id);
            expect_equal(size_t { 2 }, ix.accounts.size());
            expect(ix.accounts.at(0) == account_meta_t { a, false, true });
            expect(ix.accounts.at(1) == account_meta_t { sysvars::rent(), false, false });
            expect_equal(size_t { 35 }, ix.data.size());
            expect_equal(0, ix.data.at(0));
            expect_equal(9, ix.data.at(1));
            expect_equal(buffer { b }, buffer { ix.data }.subbuf(2, 32));
            expect_equal(0, ix.data.at(34));
        };
        "initialize mint with a freeze authority"_test = [&] {
            const auto ix = token::initialize_mint(program_ids::token_2022(), a, b, c, 6);
            expect_equal(program_ids::token_2022(), ix.program_id);
            expect_equal(size_t { 67 }, ix.data.size());
            expect_equal(1, ix.data.at(34));
            expect_equal(buffer { c }, buffer { ix.data }.subbuf(35));
        };
        "mint to"_test = [&] {
            const auto ix = token::mint_to(program_ids::token(), a, b, c, {}, 42);
            expect_equal(size_t { 3 }, ix.accounts.size());
            expect(ix.accounts.at(0) == account_meta_t { a, false, true });
            expect(ix.accounts.at(1) == account_meta_t { b, false, true });
            expect(ix.accounts.at(2) == account_meta_t { c, true, false });
            expect_equal(uint8_vector::from_hex("072a00000000000000"), ix.data);
        };
        "mint to with co-signers"_test = [&] {
            const auto ix = token::mint_to(program_ids::token(), a, b, c, { a, b }, 1);
            expect_equal(size_t { 5 }, ix.accounts.size());
            expect(ix.accounts.at(2) == account_meta_t { c, false, false });
            expect(ix.accounts.at(3) == account_meta_t { a, true, false });
            expect(ix.accounts.at(4) == account_meta_t { b, true, false });
        };
        "transfer"_test = [&] {
            const auto ix = token::transfer(program_ids::token(), a, b, a, {}, 0xFFFFFFFFFFFFFFFFULL);
            expect_equal(size_t { 3 }, ix.accounts.size());
            expect(ix.accounts.at(0) == account_meta_t { a, false, true });
            expect(ix.accounts.at(1) == account_meta_t { b, false, true });
            expect(ix.accounts.at(2) == account_meta_t { a, true, false });
            expect_equal(uint8_vector::from_hex("03ffffffffffffffff"), ix.data);
        };
        "unknown program"_test = [&] {
            expect(throws<core::err_instruction_construction_t>([&] { token::initialize_mint(program_ids::system(), a, b, {}, 9); }));
            expect(throws<core::err_instruction_construction_t>([&] { token::mint_to(c, a, b, c, {}, 1); }));
            expect(throws<core::err_instruction_construction_t>([&] { token::transfer(program_ids::system(), a, b, c, {}, 1); }));
        };
        "too many signers"_test = [&] {
            const token::signer_list_t signers(token::max_signers + 1, c);
            expect(throws<core::err_instruction_construction_t>([&] { token::mint_to(program_ids::token(), a, b, c, signers, 1); }));
            const token::signer_list_t max(token::max_signers, c);
            expect_equal(size_t { 3 + token::max_signers }, token::transfer(program_ids::token(), a, b, c, max, 1).accounts.size());
        };
    };
};
