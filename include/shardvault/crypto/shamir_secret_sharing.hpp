#pragma once
#include "shardvault/core/result.hpp"
#include "shardvault/core/failures.hpp"
#include "shardvault/interfaces/i_secret_sharing_scheme.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace shardvault::crypto {
/**
 * Shamir secret sharing over GF(2^8) (reduction polynomial 0x11B).
 *
 * Raw share layout: y-values (one byte per secret byte) followed by the
 * x coordinate. x runs from 1 to share_count.
 */
class ShamirSecretSharing final : public interfaces::ISecretSharingScheme {
public:
    static constexpr uint8_t MIN_SHARES = 2;
    static constexpr uint8_t MAX_SHARES = 255;
    static constexpr size_t MAX_SECRET_LENGTH = 64 * 1024;

    [[nodiscard]] Result<std::vector<std::vector<uint8_t>>, RecoveryFailure> Split(
        std::span<const uint8_t> secret,
        uint8_t share_count,
        uint8_t threshold) const override;

    [[nodiscard]] Result<std::vector<uint8_t>, RecoveryFailure> Combine(
        std::span<const std::vector<uint8_t>> shares) const override;
};
}
