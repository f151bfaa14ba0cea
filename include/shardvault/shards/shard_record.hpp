#pragma once
#include <cstdint>
#include <vector>

namespace shardvault::shards {
/**
 * One decoded shard.
 *
 * Invariants (enforced by ShareCodec on both directions):
 *   1 <= index <= total
 *   2 <= threshold <= total
 *   payload is non-empty
 */
struct ShardRecord {
    uint32_t index = 0;
    uint32_t threshold = 0;
    uint32_t total = 0;
    std::vector<uint8_t> payload;

    bool operator==(const ShardRecord&) const = default;
};
}
