#pragma once
#include "shardvault/core/result.hpp"
#include "shardvault/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace shardvault::interfaces {
using shardvault::Result;
using shardvault::RecoveryFailure;
/// Password-based symmetric encryption of shard tokens.
///
/// Decrypt must report an authentication failure as
/// RecoveryFailureType::WrongPassword and every structural problem
/// (bad armor, truncated packet, unsupported parameters) as
/// RecoveryFailureType::StructuralDecode.
class IPasswordCipher {
public:
    virtual ~IPasswordCipher() = default;
    [[nodiscard]] virtual Result<std::vector<uint8_t>, RecoveryFailure> Encrypt(
        std::string_view plaintext,
        std::string_view password) const = 0;
    [[nodiscard]] virtual Result<std::string, RecoveryFailure> Decrypt(
        std::span<const uint8_t> sealed,
        std::string_view password) const = 0;
};
}
