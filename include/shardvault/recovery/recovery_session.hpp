#pragma once
#include "shardvault/configuration/recovery_config.hpp"
#include "shardvault/core/result.hpp"
#include "shardvault/core/failures.hpp"
#include "shardvault/recovery/share_batch.hpp"
#include "shardvault/recovery/share_set_validator.hpp"
#include "shardvault/shards/format_detector.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shardvault::recovery {
struct InputRejection {
    std::string source;
    RecoveryFailure failure;
};

/**
 * @brief The recovery batch of one user, with a verdict kept current
 *
 * Pasted text and uploaded files feed one ordered batch: pasted candidates
 * first, then files in upload order. Every mutation revalidates the whole
 * batch.
 *
 * Pasted text: each non-empty trimmed line is one candidate, except that an
 * armored block (BEGIN line through END line) is kept together.
 *
 * Files: rejected before classification when the extension is neither the
 * plaintext nor the encrypted one, when larger than the configured limit, or
 * when a file of the same name is already in the batch.
 */
class RecoverySession {
public:
    explicit RecoverySession(
        const configuration::RecoveryConfig& config = configuration::RecoveryConfig::Default());

    /// Replaces every previously pasted candidate
    void SetPastedText(std::string_view text);

    Result<Unit, RecoveryFailure> AddFile(std::string file_name, std::vector<uint8_t> bytes);

    /// False when no file of that name is in the batch
    bool RemoveFile(std::string_view file_name);

    void Clear();

    /// Re-runs validation over the current batch
    const RecoveryVerdict& Revalidate();

    [[nodiscard]] const RecoveryVerdict& GetVerdict() const noexcept {
        return verdict_;
    }

    /// Set while the batch carries more than one threshold value
    [[nodiscard]] const std::optional<RecoveryFailure>& GetThresholdNote() const noexcept {
        return threshold_note_;
    }

    [[nodiscard]] const ShareBatch& GetBatch() const noexcept {
        return batch_;
    }

    /// Mutable access for the decryption pass; call Revalidate() afterwards
    [[nodiscard]] ShareBatch& MutableBatch() noexcept {
        return batch_;
    }

    [[nodiscard]] const std::vector<InputRejection>& GetRejections() const noexcept {
        return rejections_;
    }

    [[nodiscard]] const configuration::RecoveryConfig& GetConfig() const noexcept {
        return config_;
    }

    [[nodiscard]] size_t CountUsable() const;

    [[nodiscard]] size_t CountPending() const;

private:
    Result<Unit, RecoveryFailure> Reject(std::string source, RecoveryFailure failure);

    configuration::RecoveryConfig config_;
    shards::FormatDetector detector_;
    ShareSetValidator validator_;
    ShareBatch batch_;
    std::vector<InputRejection> rejections_;
    RecoveryVerdict verdict_;
    std::optional<RecoveryFailure> threshold_note_;
};
}
