#pragma once
#include "shardvault/core/failures.hpp"
#include "shardvault/shards/format_detector.hpp"
#include "shardvault/shards/raw_input.hpp"
#include "shardvault/shards/shard_record.hpp"
#include <optional>
#include <vector>

namespace shardvault::recovery {
/**
 * A raw input together with its classification.
 *
 * An entry is usable when it holds a PlaintextShard and has not been rejected.
 * It is pending while it still waits for a password: an armored or binary
 * payload, or an unrecognized upload that carried the encrypted extension.
 * A rejected entry stays in the batch for reporting but never counts.
 */
struct ClassifiedInput {
    shards::RawInput raw;
    shards::InputClass classification;
    std::optional<RecoveryFailure> rejection;
    // Became a PlaintextShard by decryption
    bool decrypted = false;

    [[nodiscard]] bool IsUsable() const noexcept {
        return !rejection.has_value() &&
               std::holds_alternative<shards::PlaintextShard>(classification);
    }

    [[nodiscard]] bool IsPending() const noexcept {
        if (rejection.has_value()) {
            return false;
        }
        if (shards::IsEncryptedClass(classification)) {
            return true;
        }
        return raw.expects_encrypted &&
               std::holds_alternative<shards::UnrecognizedPayload>(classification);
    }

    [[nodiscard]] const shards::ShardRecord* Record() const noexcept {
        if (!IsUsable()) {
            return nullptr;
        }
        return &std::get<shards::PlaintextShard>(classification).record;
    }
};

/// Ordered; input order decides consensus and which shards are combined.
using ShareBatch = std::vector<ClassifiedInput>;

[[nodiscard]] ClassifiedInput ClassifyInput(
    const shards::FormatDetector& detector,
    shards::RawInput raw);
}
