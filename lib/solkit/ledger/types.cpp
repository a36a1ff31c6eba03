/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <solkit/codec/base58.hpp>
#include "types.hpp"

namespace solkit::ledger {
    pubkey_t pubkey_t::from_base58(const std::string_view text, const std::string_view field)
    {
        return codec::base58::decode_fixed<pubkey_t>(text, field);
    }

    std::string pubkey_t::to_base58() const
    {
        return codec::base58::encode(*this);
    }

    namespace program_ids {
        const pubkey_t &system()
        {
            static const auto id = pubkey_t::from_base58("11111111111111111111111111111111", "system program id");
            return id;
        }

        const pubkey_t &token()
        {
            static const auto id = pubkey_t::from_base58("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA", "token program id");
            return id;
        }

        const pubkey_t &token_2022()
        {
            static const auto id = pubkey_t::from_base58("TokenzQdBNbLqP5VEhdkAS6EPFLC1PHnBqCXEpPxuEb", "token-2022 program id");
            return id;
        }
    }

    namespace sysvars {
        const pubkey_t &rent()
        {
            static const auto id = pubkey_t::from_base58("SysvarRent111111111111111111111111111111111", "rent sysvar id");
            return id;
        }
    }
}
