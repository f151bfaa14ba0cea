#pragma once
#include "shardvault/core/result.hpp"
#include "shardvault/core/failures.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace shardvault::generation {
/// Returns true when a word belongs to the caller's vocabulary (e.g. a BIP39 list)
using VocabularyPredicate = std::function<bool(std::string_view)>;

/**
 * Splits secret text into whitespace separated words and checks them.
 *
 * Rejects empty input, duplicated words (compared trimmed and lower-cased,
 * every duplicate is named in the message) and, when a vocabulary is given,
 * words outside it (1-based position in the message).
 */
[[nodiscard]] Result<std::vector<std::string>, RecoveryFailure> ValidateSecretWords(
    std::string_view secret_text,
    const VocabularyPredicate& vocabulary = {});

/// Decimal shard count as typed by a user; no sign, no trailing text, fits in 32 bits
[[nodiscard]] Result<uint32_t, RecoveryFailure> ParseShardCount(std::string_view text);

/// Words joined by single spaces; this is the byte string that gets split.
[[nodiscard]] std::string NormalizeSecret(const std::vector<std::string>& words);

enum class PasswordStrength : uint8_t {
    Weak,
    Medium,
    Strong
};

struct PasswordAssessment {
    PasswordStrength strength;
    uint32_t score;
};

/**
 * One point each for: length >= 8, length >= 12, an upper-case letter,
 * a lower-case letter, a digit, a punctuation character.
 * Below 3 is weak, below 5 medium, otherwise strong.
 */
[[nodiscard]] PasswordAssessment AssessPassword(std::string_view password) noexcept;

[[nodiscard]] std::string_view StrengthName(PasswordStrength strength) noexcept;

/// Rejects an empty or weak password and a confirmation that differs
[[nodiscard]] Result<Unit, RecoveryFailure> CheckEncryptionPassword(
    std::string_view password,
    std::string_view confirmation);

/// Random password over upper, lower, digit and punctuation characters
[[nodiscard]] Result<std::string, RecoveryFailure> GenerateRandomPassword(size_t length = 16);
}
