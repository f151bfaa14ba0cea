#pragma once
#include "shardvault/configuration/recovery_config.hpp"
#include "shardvault/core/failures.hpp"
#include "shardvault/recovery/share_batch.hpp"
#include "shardvault/recovery/threshold_consensus.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace shardvault::recovery {
namespace verdict {
    struct Waiting {
        bool operator==(const Waiting&) const = default;
    };

    struct InsufficientShares {
        size_t have = 0;
        uint32_t need = 0;
        bool operator==(const InsufficientShares&) const = default;
    };

    struct DuplicateIndices {
        std::vector<uint32_t> indices;
        bool operator==(const DuplicateIndices&) const = default;
    };

    struct InvalidFormat {
        size_t unrecognized = 0;
        bool operator==(const InvalidFormat&) const = default;
    };

    struct PasswordRequired {
        size_t pending = 0;
        bool operator==(const PasswordRequired&) const = default;
    };

    struct Ready {
        size_t usable = 0;
        uint32_t threshold = 0;
        bool operator==(const Ready&) const = default;
    };
}

using RecoveryVerdict = std::variant<
    verdict::Waiting,
    verdict::InsufficientShares,
    verdict::DuplicateIndices,
    verdict::InvalidFormat,
    verdict::PasswordRequired,
    verdict::Ready>;

[[nodiscard]] std::string_view VerdictName(const RecoveryVerdict& verdict) noexcept;

/// Stable user-facing message for a verdict
[[nodiscard]] std::string DescribeVerdict(const RecoveryVerdict& verdict);

/// Failure reported when recovery stops at a non-Ready verdict
[[nodiscard]] RecoveryFailure VerdictToFailure(const RecoveryVerdict& verdict);

[[nodiscard]] inline bool IsReady(const RecoveryVerdict& verdict) noexcept {
    return std::holds_alternative<verdict::Ready>(verdict);
}

/**
 * Pure verdict over a batch; callers re-run it after every mutation.
 *
 * Priority:
 *   empty batch                              -> Waiting
 *   no usable and no pending entry           -> InvalidFormat
 *   no usable, some pending                  -> PasswordRequired
 *   two usable entries share an index        -> DuplicateIndices
 *   usable count below consensus threshold   -> InsufficientShares
 *   otherwise                                -> Ready
 */
class ShareSetValidator {
public:
    explicit ShareSetValidator(
        const configuration::RecoveryConfig& config = configuration::RecoveryConfig::Default()) noexcept;

    [[nodiscard]] RecoveryVerdict Validate(const ShareBatch& batch) const;

    [[nodiscard]] uint32_t ResolveThreshold(const ShareBatch& batch) const;

    [[nodiscard]] std::optional<RecoveryFailure> CheckThresholdAgreement(const ShareBatch& batch) const;

private:
    ThresholdConsensus consensus_;
};
}
