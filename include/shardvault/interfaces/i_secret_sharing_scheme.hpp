#pragma once
#include "shardvault/core/result.hpp"
#include "shardvault/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace shardvault::interfaces {
using shardvault::Result;
using shardvault::RecoveryFailure;
/// Threshold splitting primitive. Raw shares are self-describing byte strings;
/// callers never look inside them.
class ISecretSharingScheme {
public:
    virtual ~ISecretSharingScheme() = default;
    [[nodiscard]] virtual Result<std::vector<std::vector<uint8_t>>, RecoveryFailure> Split(
        std::span<const uint8_t> secret,
        uint8_t share_count,
        uint8_t threshold) const = 0;
    [[nodiscard]] virtual Result<std::vector<uint8_t>, RecoveryFailure> Combine(
        std::span<const std::vector<uint8_t>> shares) const = 0;
};
}
