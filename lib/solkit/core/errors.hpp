#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string_view>
#include <solkit/common/error.hpp>

namespace solkit::core {
    enum class error_code_t {
        invalid_encoding,
        invalid_secret_encoding,
        invalid_secret_length,
        invalid_keypair,
        invalid_public_key_length,
        invalid_signature_length,
        invalid_address,
        instruction_construction_failed,
        invalid_request
    };

    extern std::string_view error_code_name(error_code_t code);

    // Errors caused by caller-supplied input. The message names the input and the violated constraint.
    struct api_error: error {
        api_error(const error_code_t code, const std::string_view msg):
            error { msg },
            _code { code }
        {
        }

        error_code_t code() const noexcept
        {
            return _code;
        }
    private:
        error_code_t _code;
    };

    struct err_invalid_encoding_t final: api_error {
        explicit err_invalid_encoding_t(const std::string_view msg): api_error { error_code_t::invalid_encoding, msg } {}
    };
    struct err_invalid_secret_encoding_t final: api_error {
        explicit err_invalid_secret_encoding_t(const std::string_view msg): api_error { error_code_t::invalid_secret_encoding, msg } {}
    };
    struct err_invalid_secret_length_t final: api_error {
        explicit err_invalid_secret_length_t(const std::string_view msg): api_error { error_code_t::invalid_secret_length, msg } {}
    };
    struct err_invalid_keypair_t final: api_error {
        explicit err_invalid_keypair_t(const std::string_view msg): api_error { error_code_t::invalid_keypair, msg } {}
    };
    struct err_invalid_public_key_length_t final: api_error {
        explicit err_invalid_public_key_length_t(const std::string_view msg): api_error { error_code_t::invalid_public_key_length, msg } {}
    };
    struct err_invalid_signature_length_t final: api_error {
        explicit err_invalid_signature_length_t(const std::string_view msg): api_error { error_code_t::invalid_signature_length, msg } {}
    };
    struct err_invalid_address_t final: api_error {
        explicit err_invalid_address_t(const std::string_view msg): api_error { error_code_t::invalid_address, msg } {}
    };
    struct err_instruction_construction_t final: api_error {
        explicit err_instruction_construction_t(const std::string_view msg): api_error { error_code_t::instruction_construction_failed, msg } {}
    };
    struct err_invalid_request_t final: api_error {
        explicit err_invalid_request_t(const std::string_view msg): api_error { error_code_t::invalid_request, msg } {}
    };
}
