/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <solkit/common/format.hpp>
#include "errors.hpp"

namespace solkit::core {
    std::string_view error_code_name(const error_code_t code)
    {
        switch (code) {
            case error_code_t::invalid_encoding: return "InvalidEncoding";
            case error_code_t::invalid_secret_encoding: return "InvalidSecretEncoding";
            case error_code_t::invalid_secret_length: return "InvalidSecretLength";
            case error_code_t::invalid_keypair: return "InvalidKeypair";
            case error_code_t::invalid_public_key_length: return "InvalidPublicKeyLength";
            case error_code_t::invalid_signature_length: return "InvalidSignatureLength";
            case error_code_t::invalid_address: return "InvalidAddress";
            case error_code_t::instruction_construction_failed: return "InstructionConstructionFailed";
            case error_code_t::invalid_request: return "InvalidRequest";
            default: throw error(fmt::format("unsupported error code: {}", static_cast<int>(code)));
        }
    }
}
