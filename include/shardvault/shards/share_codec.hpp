#pragma once
#include "shardvault/core/result.hpp"
#include "shardvault/core/failures.hpp"
#include "shardvault/shards/shard_record.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace shardvault::shards {
/**
 * Shard token codec.
 *
 * A token is the standard base64 text of a serialized
 * proto::shards::ShardToken message. Decoding ignores surrounding
 * whitespace and unknown protobuf fields; a field written with the wrong
 * wire type is treated as unknown and therefore reported as missing.
 *
 * Decode(Encode(r)) == r for every record satisfying ShardRecord's
 * invariants.
 */
class ShareCodec {
public:
    [[nodiscard]] static Result<std::string, RecoveryFailure> Encode(const ShardRecord& record);

    [[nodiscard]] static Result<ShardRecord, RecoveryFailure> Decode(std::string_view token);

    /**
     * Threshold carried by a token that parses structurally but may fail
     * the record invariants. Used as a consensus vote only.
     */
    [[nodiscard]] static std::optional<uint32_t> PeekThreshold(std::string_view token);

private:
    static Result<Unit, RecoveryFailure> CheckInvariants(const ShardRecord& record);

    ShareCodec() = delete;
};
}
