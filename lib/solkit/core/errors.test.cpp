/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <solkit/common/test.hpp>
#include "errors.hpp"

namespace {
    using namespace solkit;
    using namespace solkit::core;
}

suite solkit_core_errors_suite = [] {
    "solkit::core::errors"_test = [] {
        "codes"_test = [] {
            expect(err_invalid_encoding_t { "x" }.code() == error_code_t::invalid_encoding);
            expect(err_invalid_secret_encoding_t { "x" }.code() == error_code_t::invalid_secret_encoding);
            expect(err_invalid_secret_length_t { "x" }.code() == error_code_t::invalid_secret_length);
            expect(err_invalid_keypair_t { "x" }.code() == error_code_t::invalid_keypair);
            expect(err_invalid_public_key_length_t { "x" }.code() == error_code_t::invalid_public_key_length);
            expect(err_invalid_signature_length_t { "x" }.code() == error_code_t::invalid_signature_length);
            expect(err_invalid_address_t { "x" }.code() == error_code_t::invalid_address);
            expect(err_instruction_construction_t { "x" }.code() == error_code_t::instruction_construction_failed);
            expect(err_invalid_request_t { "x" }.code() == error_code_t::invalid_request);
        };
        "names"_test = [] {
            expect_equal(std::string_view { "InvalidAddress" }, error_code_name(error_code_t::invalid_address));
            expect_equal(std::string_view { "InvalidSignatureLength" }, error_code_name(error_code_t::invalid_signature_length));
            expect_equal(std::string_view { "InstructionConstructionFailed" }, error_code_name(error_code_t::instruction_construction_failed));
        };
        "hierarchy"_test = [] {
            expect(throws<api_error>([] { throw err_invalid_address_t { "mint: bad" }; }));
            expect(throws<error>([] { throw err_invalid_address_t { "mint: bad" }; }));
            try {
                throw err_invalid_public_key_length_t { "pubkey: expected 32 bytes but got 31" };
            } catch (const api_error &ex) {
                expect(ex.code() == error_code_t::invalid_public_key_length);
                expect_equal(std::string_view { "pubkey: expected 32 bytes but got 31" }, std::string_view { ex.what() });
            }
        };
    };
};
