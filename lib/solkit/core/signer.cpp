/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "signer.hpp"

namespace solkit::core {
    crypto::ed25519::signature_t signer_t::sign(const buffer &msg, const key_pair_t &kp) const
    {
        return crypto::ed25519::sign(msg, kp.sk);
    }
}
