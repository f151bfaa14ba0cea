#pragma once
#include "shardvault/core/result.hpp"
#include "shardvault/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace shardvault::crypto {
/**
 * ASCII armor for sealed shard packets.
 *
 *   -----BEGIN SHARDVAULT MESSAGE-----
 *   Version: shardvault 1
 *
 *   <base64, 64 columns>
 *   -----END SHARDVAULT MESSAGE-----
 *
 * Header lines ("Key: value") are optional on input and end at the first
 * blank line. Text before the BEGIN line and after the END line is ignored.
 */
class Armor {
public:
    [[nodiscard]] static std::string Wrap(std::span<const uint8_t> packet);

    [[nodiscard]] static Result<std::vector<uint8_t>, RecoveryFailure> Unwrap(std::string_view text);

    [[nodiscard]] static bool ContainsHeader(std::string_view text) noexcept;

    [[nodiscard]] static bool StartsWithHeader(std::span<const uint8_t> bytes) noexcept;

private:
    Armor() = delete;
};
}
