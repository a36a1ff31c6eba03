#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "key-manager.hpp"

namespace solkit::core {
    struct signer_t {
        // Deterministic: the same key pair and message always give the same signature
        [[nodiscard]] crypto::ed25519::signature_t sign(const buffer &msg, const key_pair_t &kp) const;
    };
}
