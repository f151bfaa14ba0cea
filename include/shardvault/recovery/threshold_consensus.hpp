#pragma once
#include "shardvault/core/constants.hpp"
#include "shardvault/core/failures.hpp"
#include "shardvault/recovery/share_batch.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace shardvault::recovery {
struct ThresholdCandidate {
    std::optional<uint32_t> threshold;
    bool fully_decoded = false;
};

/**
 * Resolves the threshold a batch is validated against.
 *
 * 1. threshold of the first fully decoded candidate, in input order
 * 2. otherwise the most frequent threshold among candidates (ties: first seen)
 * 3. otherwise the configured default
 *
 * Candidates from unrelated splits are not detected here; a batch mixing
 * two splits resolves to the first record's threshold.
 */
class ThresholdConsensus {
public:
    explicit ThresholdConsensus(
        uint32_t default_threshold = Constants::DEFAULT_CONSENSUS_THRESHOLD) noexcept;

    [[nodiscard]] uint32_t Resolve(std::span<const ThresholdCandidate> candidates) const;

    /// ThresholdMismatch note when candidates carry more than one threshold; never fatal
    [[nodiscard]] std::optional<RecoveryFailure> CheckAgreement(
        std::span<const ThresholdCandidate> candidates) const;

    [[nodiscard]] static std::vector<ThresholdCandidate> CandidatesFrom(const ShareBatch& batch);

    [[nodiscard]] uint32_t GetDefaultThreshold() const noexcept {
        return default_threshold_;
    }

private:
    uint32_t default_threshold_;
};
}
