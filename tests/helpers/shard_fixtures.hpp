#pragma once
#include "shardvault/configuration/kdf_profile.hpp"
#include "shardvault/crypto/armor.hpp"
#include "shardvault/crypto/password_cipher.hpp"
#include "shardvault/crypto/shamir_secret_sharing.hpp"
#include "shardvault/crypto/sodium_interop.hpp"
#include "shardvault/interfaces/i_password_cipher.hpp"
#include "shardvault/interfaces/i_secret_sharing_scheme.hpp"
#include "shardvault/shards/raw_input.hpp"
#include "shardvault/shards/share_codec.hpp"
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace shardvault::test_helpers {

using crypto::PasswordCipher;
using crypto::ShamirSecretSharing;
using crypto::SodiumInterop;
using shards::RawInput;
using shards::ShardRecord;
using shards::ShareCodec;

inline constexpr std::string_view kSampleSecret =
    "abandon ability able about above absent absorb abstract absurd abuse access accident";
inline constexpr std::string_view kSamplePassword = "Correct-Horse-42";

/// Argon2id at libsodium's minimum cost, so sealing stays fast under test
inline PasswordCipher MakeFastCipher() {
    return PasswordCipher(configuration::KdfProfile::Minimal());
}

inline std::vector<uint8_t> RandomBytes(const size_t size) {
    std::vector<uint8_t> bytes(size);
    SodiumInterop::FillRandom(bytes);
    return bytes;
}

inline std::vector<uint8_t> ToBytes(std::string_view text) {
    return {text.begin(), text.end()};
}

/// Splits `secret` and returns one encoded token per share, in index order
inline std::vector<std::string> MakeTokens(
    std::string_view secret,
    const uint32_t total,
    const uint32_t threshold) {
    if (SodiumInterop::Initialize().IsErr()) {
        throw std::runtime_error("libsodium initialization failed");
    }
    ShamirSecretSharing scheme;
    auto split = scheme.Split(
        std::span(reinterpret_cast<const uint8_t*>(secret.data()), secret.size()),
        static_cast<uint8_t>(total),
        static_cast<uint8_t>(threshold));
    if (split.IsErr()) {
        throw std::runtime_error(split.UnwrapErr().message);
    }
    auto shares = std::move(split).Unwrap();
    std::vector<std::string> tokens;
    for (uint32_t i = 0; i < total; ++i) {
        auto token = ShareCodec::Encode(ShardRecord{
            .index = i + 1,
            .threshold = threshold,
            .total = total,
            .payload = std::move(shares[i])
        });
        if (token.IsErr()) {
            throw std::runtime_error(token.UnwrapErr().message);
        }
        tokens.push_back(std::move(token).Unwrap());
    }
    return tokens;
}

inline std::vector<uint8_t> SealToken(
    const PasswordCipher& cipher,
    std::string_view token,
    std::string_view password,
    const bool armored) {
    auto sealed = cipher.Encrypt(token, password);
    if (sealed.IsErr()) {
        throw std::runtime_error(sealed.UnwrapErr().message);
    }
    auto packet = std::move(sealed).Unwrap();
    if (armored) {
        return ToBytes(crypto::Armor::Wrap(packet));
    }
    return packet;
}

inline RawInput PlaintextFile(std::string name, std::string_view token) {
    return RawInput::FromFile(std::move(name), ToBytes(token), false);
}

inline RawInput SealedFile(std::string name, std::vector<uint8_t> bytes) {
    return RawInput::FromFile(std::move(name), std::move(bytes), true);
}

/// Splitting primitive whose Combine fails or throws on demand
class FaultySecretSharingScheme : public interfaces::ISecretSharingScheme {
public:
    enum class Mode { FailCombine, ThrowOnCombine, ThrowOnSplit };

    explicit FaultySecretSharingScheme(const Mode mode) : mode_(mode) {}

    [[nodiscard]] Result<std::vector<std::vector<uint8_t>>, RecoveryFailure> Split(
        std::span<const uint8_t> secret,
        const uint8_t share_count,
        const uint8_t threshold) const override {
        if (mode_ == Mode::ThrowOnSplit) {
            throw std::runtime_error("split backend unavailable");
        }
        return inner_.Split(secret, share_count, threshold);
    }

    [[nodiscard]] Result<std::vector<uint8_t>, RecoveryFailure> Combine(
        std::span<const std::vector<uint8_t>> shares) const override {
        if (mode_ == Mode::ThrowOnCombine) {
            throw std::runtime_error("combine backend unavailable");
        }
        if (mode_ == Mode::FailCombine) {
            return Result<std::vector<uint8_t>, RecoveryFailure>::Err(
                RecoveryFailure::InvalidInput("Share checksum mismatch"));
        }
        return inner_.Combine(shares);
    }

private:
    Mode mode_;
    ShamirSecretSharing inner_;
};

/// Cipher whose Decrypt throws; Encrypt is never expected to be called
class ThrowingPasswordCipher : public interfaces::IPasswordCipher {
public:
    [[nodiscard]] Result<std::vector<uint8_t>, RecoveryFailure> Encrypt(
        std::string_view,
        std::string_view) const override {
        throw std::runtime_error("cipher backend unavailable");
    }

    [[nodiscard]] Result<std::string, RecoveryFailure> Decrypt(
        std::span<const uint8_t>,
        std::string_view) const override {
        throw std::runtime_error("cipher backend unavailable");
    }
};

}
