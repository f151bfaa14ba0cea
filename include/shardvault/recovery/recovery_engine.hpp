#pragma once
#include "shardvault/configuration/recovery_config.hpp"
#include "shardvault/core/result.hpp"
#include "shardvault/core/failures.hpp"
#include "shardvault/interfaces/i_password_cipher.hpp"
#include "shardvault/interfaces/i_password_prompt.hpp"
#include "shardvault/interfaces/i_secret_sharing_scheme.hpp"
#include "shardvault/recovery/recovery_session.hpp"
#include "shardvault/recovery/share_batch.hpp"
#include "shardvault/recovery/share_set_validator.hpp"
#include "shardvault/shards/format_detector.hpp"
#include "shardvault/shards/raw_input.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace shardvault::recovery {
struct RecoveredSecret {
    std::string secret;
    size_t usable_shards = 0;
    uint32_t threshold = 0;
    size_t decrypted_shards = 0;
};

/**
 * @brief Classify, validate, decrypt, combine
 *
 * 1. classify every input
 * 2. validate the plaintext part; Ready skips decryption
 * 3. otherwise run the DecryptionCoordinator over the pending inputs and
 *    validate again
 * 4. combine the payloads of the first `threshold` usable records, in
 *    input order
 *
 * Failures:
 * - DuplicateIndex, InsufficientShares, UnrecognizedFormat, PasswordRequired:
 *   the last verdict did not reach Ready
 * - Cancelled: the password prompt was dismissed
 * - WrongPassword: the retry cap was reached with inputs still locked
 * - Reconstruction: the splitting primitive rejected the shards or did not
 *   produce text; its message is carried verbatim
 *
 * Exceptions thrown by the primitives never leave this class.
 */
class RecoveryEngine {
public:
    RecoveryEngine(
        const interfaces::ISecretSharingScheme& scheme,
        const interfaces::IPasswordCipher& cipher,
        const configuration::RecoveryConfig& config = configuration::RecoveryConfig::Default());

    [[nodiscard]] Result<RecoveredSecret, RecoveryFailure> Recover(
        std::vector<shards::RawInput> inputs,
        interfaces::IPasswordPrompt& prompt) const;

    /// Decrypted entries stay in the session, also when recovery fails
    [[nodiscard]] Result<RecoveredSecret, RecoveryFailure> Recover(
        RecoverySession& session,
        interfaces::IPasswordPrompt& prompt) const;

private:
    [[nodiscard]] Result<RecoveredSecret, RecoveryFailure> RecoverBatch(
        ShareBatch& batch,
        interfaces::IPasswordPrompt& prompt) const;

    [[nodiscard]] Result<RecoveredSecret, RecoveryFailure> Reconstruct(
        const ShareBatch& batch,
        const verdict::Ready& ready) const;

    const interfaces::ISecretSharingScheme& scheme_;
    const interfaces::IPasswordCipher& cipher_;
    configuration::RecoveryConfig config_;
    shards::FormatDetector detector_;
    ShareSetValidator validator_;
};
}
