#include "shardvault/generation/secret_policy.hpp"
#include "shardvault/crypto/sodium_interop.hpp"
#include "shardvault/core/constants.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <limits>
#include <system_error>

namespace shardvault::generation {
using crypto::SodiumInterop;
namespace {
    constexpr std::string_view kPunctuation = "!@#$%^&*()_+-=[]{};':\"\\|,.<>/?";
    constexpr std::string_view kPasswordAlphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz"
        "0123456789"
        "!@#$%^&*()_+-=[]{}|;:,.<>?";

    std::string ToLower(std::string_view word) {
        std::string lowered(word);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
            [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lowered;
    }

    std::vector<std::string> SplitWords(std::string_view text) {
        std::vector<std::string> words;
        size_t start = 0;
        while (start < text.size()) {
            while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
                ++start;
            }
            size_t end = start;
            while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) {
                ++end;
            }
            if (end > start) {
                words.emplace_back(text.substr(start, end - start));
            }
            start = end;
        }
        return words;
    }
}

Result<std::vector<std::string>, RecoveryFailure> ValidateSecretWords(
    std::string_view secret_text,
    const VocabularyPredicate& vocabulary) {
    using WordsResult = Result<std::vector<std::string>, RecoveryFailure>;
    auto words = SplitWords(secret_text);
    if (words.empty()) {
        return WordsResult::Err(RecoveryFailure::InvalidInput("Secret must not be empty"));
    }

    std::vector<std::string> seen;
    std::vector<std::string> duplicates;
    for (const auto& word : words) {
        auto lowered = ToLower(word);
        if (std::find(seen.begin(), seen.end(), lowered) == seen.end()) {
            seen.push_back(std::move(lowered));
        } else if (std::find(duplicates.begin(), duplicates.end(), lowered) == duplicates.end()) {
            duplicates.push_back(std::move(lowered));
        }
    }
    if (!duplicates.empty()) {
        std::string joined;
        for (const auto& word : duplicates) {
            joined += joined.empty() ? word : ", " + word;
        }
        return WordsResult::Err(RecoveryFailure::InvalidInput(
            std::format("Duplicate words detected: {}", joined)));
    }

    if (vocabulary) {
        for (size_t i = 0; i < words.size(); ++i) {
            if (!vocabulary(words[i])) {
                return WordsResult::Err(RecoveryFailure::InvalidInput(
                    std::format("Word {} is not in the vocabulary", i + 1)));
            }
        }
    }
    return WordsResult::Ok(std::move(words));
}

Result<uint32_t, RecoveryFailure> ParseShardCount(std::string_view text) {
    uint32_t value = 0;
    const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || error != std::errc() || end != text.data() + text.size()) {
        return Result<uint32_t, RecoveryFailure>::Err(RecoveryFailure::InvalidInput(
            std::format("Shard count must be a whole number up to {}, got \"{}\"",
                std::numeric_limits<uint32_t>::max(), text)));
    }
    return Result<uint32_t, RecoveryFailure>::Ok(value);
}

std::string NormalizeSecret(const std::vector<std::string>& words) {
    std::string normalized;
    for (const auto& word : words) {
        if (!normalized.empty()) {
            normalized.push_back(' ');
        }
        normalized += word;
    }
    return normalized;
}

PasswordAssessment AssessPassword(std::string_view password) noexcept {
    const auto has = [&](auto&& predicate) {
        return std::any_of(password.begin(), password.end(), [&](const char c) {
            return predicate(static_cast<unsigned char>(c));
        });
    };
    uint32_t score = 0;
    if (password.size() >= 8) {
        ++score;
    }
    if (password.size() >= 12) {
        ++score;
    }
    if (has([](const unsigned char c) { return c >= 'A' && c <= 'Z'; })) {
        ++score;
    }
    if (has([](const unsigned char c) { return c >= 'a' && c <= 'z'; })) {
        ++score;
    }
    if (has([](const unsigned char c) { return c >= '0' && c <= '9'; })) {
        ++score;
    }
    if (has([](const unsigned char c) { return kPunctuation.find(static_cast<char>(c)) != std::string_view::npos; })) {
        ++score;
    }

    PasswordStrength strength = PasswordStrength::Strong;
    if (score < 3) {
        strength = PasswordStrength::Weak;
    } else if (score < 5) {
        strength = PasswordStrength::Medium;
    }
    return PasswordAssessment{.strength = strength, .score = score};
}

std::string_view StrengthName(const PasswordStrength strength) noexcept {
    switch (strength) {
        case PasswordStrength::Weak: return "weak";
        case PasswordStrength::Medium: return "medium";
        case PasswordStrength::Strong: return "strong";
    }
    return "unknown";
}

Result<Unit, RecoveryFailure> CheckEncryptionPassword(
    std::string_view password,
    std::string_view confirmation) {
    if (password.empty()) {
        return Result<Unit, RecoveryFailure>::Err(
            RecoveryFailure::InvalidInput("Password must not be empty"));
    }
    if (confirmation.empty()) {
        return Result<Unit, RecoveryFailure>::Err(
            RecoveryFailure::InvalidInput("Password confirmation must not be empty"));
    }
    if (SodiumInterop::Initialize().IsErr()) {
        return Result<Unit, RecoveryFailure>::Err(
            RecoveryFailure::Generic(std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }
    const auto matches = SodiumInterop::ConstantTimeEquals(
        std::span(reinterpret_cast<const uint8_t*>(password.data()), password.size()),
        std::span(reinterpret_cast<const uint8_t*>(confirmation.data()), confirmation.size()));
    if (matches.IsErr()) {
        return Result<Unit, RecoveryFailure>::Err(RecoveryFailure::FromSodiumFailure(matches.UnwrapErr()));
    }
    if (!matches.Unwrap()) {
        return Result<Unit, RecoveryFailure>::Err(
            RecoveryFailure::InvalidInput("Passwords do not match"));
    }
    if (AssessPassword(password).strength == PasswordStrength::Weak) {
        return Result<Unit, RecoveryFailure>::Err(RecoveryFailure::InvalidInput(
            "Password is too weak: use at least 8 characters mixing upper and lower case, digits and symbols"));
    }
    return Result<Unit, RecoveryFailure>::Ok(unit);
}

Result<std::string, RecoveryFailure> GenerateRandomPassword(const size_t length) {
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<std::string, RecoveryFailure>::Err(RecoveryFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    std::string password(length, '\0');
    for (auto& c : password) {
        c = kPasswordAlphabet[SodiumInterop::RandomUniform(static_cast<uint32_t>(kPasswordAlphabet.size()))];
    }
    return Result<std::string, RecoveryFailure>::Ok(std::move(password));
}
}
