#pragma once

#include "shardvault/core/constants.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace shardvault::configuration {

/**
 * @brief Limits and conventions for one recovery session
 *
 * **Batch surface**:
 * - Uploaded files must carry the plaintext extension (`.txt`) or the
 *   encrypted extension (`.svlt`); anything else is rejected before
 *   classification.
 * - Files larger than the size limit are rejected.
 *
 * **Password retry**:
 * The decryption coordinator prompts at most GetMaxPasswordAttempts() times
 * per pass sequence. After the cap, remaining encrypted inputs stay locked.
 *
 * **Usage Example**:
 * ```cpp
 * auto config = RecoveryConfig::Default();
 * RecoverySession session(config);
 * ```
 */
class RecoveryConfig {
public:
    static constexpr std::string_view PLAINTEXT_EXTENSION = ".txt";
    static constexpr std::string_view ENCRYPTED_EXTENSION = ".svlt";

    constexpr RecoveryConfig(
        const size_t max_file_size_bytes,
        const uint32_t max_password_attempts,
        const uint32_t default_threshold,
        const size_t short_text_limit) noexcept
        : max_file_size_bytes_(max_file_size_bytes)
        , max_password_attempts_(max_password_attempts)
        , default_threshold_(default_threshold)
        , short_text_limit_(short_text_limit) {}

    /**
     * @brief 5 MiB uploads, 3 password attempts, consensus fallback of 3
     */
    [[nodiscard]] static constexpr RecoveryConfig Default() noexcept {
        return RecoveryConfig(
            5 * 1024 * 1024,
            3,
            Constants::DEFAULT_CONSENSUS_THRESHOLD,
            200);
    }

    /**
     * @brief Single password attempt and 1 MiB uploads
     */
    [[nodiscard]] static constexpr RecoveryConfig Strict() noexcept {
        return RecoveryConfig(
            1024 * 1024,
            1,
            Constants::DEFAULT_CONSENSUS_THRESHOLD,
            200);
    }

    [[nodiscard]] constexpr size_t GetMaxFileSizeBytes() const noexcept {
        return max_file_size_bytes_;
    }

    [[nodiscard]] constexpr uint32_t GetMaxPasswordAttempts() const noexcept {
        return max_password_attempts_;
    }

    /// Threshold enforced when no candidate carries one
    [[nodiscard]] constexpr uint32_t GetDefaultThreshold() const noexcept {
        return default_threshold_;
    }

    /// Text shorter than this is also probed as binary
    [[nodiscard]] constexpr size_t GetShortTextLimit() const noexcept {
        return short_text_limit_;
    }

    [[nodiscard]] constexpr bool operator==(const RecoveryConfig& other) const noexcept {
        return max_file_size_bytes_ == other.max_file_size_bytes_ &&
               max_password_attempts_ == other.max_password_attempts_ &&
               default_threshold_ == other.default_threshold_ &&
               short_text_limit_ == other.short_text_limit_;
    }

private:
    size_t max_file_size_bytes_;
    uint32_t max_password_attempts_;
    uint32_t default_threshold_;
    size_t short_text_limit_;
};

} // namespace shardvault::configuration
