#pragma once
#include "shardvault/configuration/recovery_config.hpp"
#include "shardvault/interfaces/i_password_cipher.hpp"
#include "shardvault/interfaces/i_password_prompt.hpp"
#include "shardvault/recovery/share_batch.hpp"
#include "shardvault/recovery/share_set_validator.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shardvault::recovery {
enum class CoordinatorState : uint8_t {
    AwaitingPassword,
    Finished
};

enum class DecryptionOutcome : uint8_t {
    NothingPending,
    Completed,
    Cancelled,
    RetriesExhausted
};

enum class AttemptResult : uint8_t {
    Success,
    WrongPassword,
    Malformed
};

/// One password applied to one input. The password itself is not kept.
struct DecryptionAttempt {
    size_t input_index;
    uint32_t pass;
    AttemptResult result;
};

struct DecryptionPassResult {
    size_t decrypted = 0;
    size_t wrong_password = 0;
    size_t invalidated = 0;
    RecoveryVerdict verdict;
};

struct DecryptionReport {
    DecryptionOutcome outcome;
    uint32_t passes;
    size_t decrypted;
    RecoveryVerdict verdict;
};

/**
 * @brief Password acquisition and retry for the encrypted part of a batch
 *
 * Explicit state machine over a batch it borrows:
 *
 *   AwaitingPassword --SubmitPassword--> AwaitingPassword  (wrong password, passes left)
 *                    --SubmitPassword--> Finished          (Ready, nothing pending, or cap hit)
 *                    --Cancel---------> Finished(Cancelled)
 *
 * Per pending input and pass:
 * - decrypts and decodes as a shard token: becomes usable
 * - decrypts but is not a shard token: rejected, never retried
 * - wrong password: stays pending
 * - any other failure: rejected
 *
 * Entries decrypted in earlier passes stay usable after a cancel.
 * The batch must outlive the coordinator.
 */
class DecryptionCoordinator {
public:
    DecryptionCoordinator(
        ShareBatch& batch,
        const interfaces::IPasswordCipher& cipher,
        const configuration::RecoveryConfig& config = configuration::RecoveryConfig::Default());

    [[nodiscard]] CoordinatorState GetState() const noexcept {
        return state_;
    }

    /// Meaningful once the state is Finished
    [[nodiscard]] DecryptionOutcome GetOutcome() const noexcept {
        return outcome_;
    }

    /// Request to show while AwaitingPassword, std::nullopt otherwise
    [[nodiscard]] std::optional<interfaces::PasswordRequest> NextPrompt() const;

    /// Applies one password to every pending input. An empty password cancels.
    DecryptionPassResult SubmitPassword(std::string password);

    void Cancel();

    /// Drives the prompt until the state machine finishes
    DecryptionReport Run(interfaces::IPasswordPrompt& prompt);

    [[nodiscard]] const RecoveryVerdict& GetVerdict() const noexcept {
        return verdict_;
    }

    [[nodiscard]] const std::vector<DecryptionAttempt>& GetAttempts() const noexcept {
        return attempts_;
    }

    [[nodiscard]] uint32_t GetPassesUsed() const noexcept {
        return passes_used_;
    }

    [[nodiscard]] size_t CountPending() const;

private:
    AttemptResult DecryptEntry(ClassifiedInput& entry, const std::string& password) const;

    ShareBatch& batch_;
    const interfaces::IPasswordCipher& cipher_;
    ShareSetValidator validator_;
    uint32_t max_passes_;
    CoordinatorState state_;
    DecryptionOutcome outcome_;
    interfaces::PromptKind next_kind_;
    uint32_t passes_used_;
    size_t decrypted_total_;
    RecoveryVerdict verdict_;
    std::vector<DecryptionAttempt> attempts_;
};
}
