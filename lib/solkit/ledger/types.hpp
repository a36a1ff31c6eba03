#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include <vector>
#include <solkit/common/bytes.hpp>

namespace solkit::ledger {
    struct pubkey_t: byte_array<32> {
        using byte_array::byte_array;

        // throws core::err_invalid_encoding_t naming the field
        static pubkey_t from_base58(std::string_view text, std::string_view field="pubkey");
        [[nodiscard]] std::string to_base58() const;
    };

    using optional_pubkey_t = std::optional<pubkey_t>;

    struct account_meta_t {
        pubkey_t pubkey;
        bool is_signer = false;
        bool is_writable = false;

        static account_meta_t writable(const pubkey_t &pk, const bool signer)
        {
            return { pk, signer, true };
        }

        static account_meta_t readonly(const pubkey_t &pk, const bool signer)
        {
            return { pk, signer, false };
        }

        bool operator==(const account_meta_t &o) const =default;
    };

    struct instruction_t {
        pubkey_t program_id;
        std::vector<account_meta_t> accounts {};
        uint8_vector data {};
    };

    namespace program_ids {
        extern const pubkey_t &system();
        extern const pubkey_t &token();
        extern const pubkey_t &token_2022();
    }

    namespace sysvars {
        extern const pubkey_t &rent();
    }
}

namespace fmt {
    template<>
    struct formatter<solkit::ledger::pubkey_t>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const solkit::ledger::pubkey_t &pk, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<std::string_view>::format(pk.to_base58(), ctx);
        }
    };
}
