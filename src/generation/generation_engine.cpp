#include "shardvault/generation/generation_engine.hpp"
#include "shardvault/configuration/recovery_config.hpp"
#include "shardvault/crypto/armor.hpp"
#include "shardvault/crypto/sodium_interop.hpp"
#include "shardvault/shards/share_codec.hpp"
#include "shardvault/core/constants.hpp"
#include "shardvault/debug/trace_log.hpp"
#include <chrono>
#include <exception>
#include <format>

namespace shardvault::generation {
using configuration::RecoveryConfig;
using crypto::SodiumInterop;
namespace {
    using GenerateResult = Result<GenerationResult, RecoveryFailure>;
    constexpr size_t kSeparatorWidth = 50;

    std::string CurrentTimestamp() {
        const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
        return std::format("{:%Y-%m-%d %H:%M:%S} UTC", now);
    }

    std::vector<uint8_t> ToBytes(std::string_view text) {
        return {text.begin(), text.end()};
    }
}

GenerationEngine::GenerationEngine(
    const interfaces::ISecretSharingScheme& scheme,
    const interfaces::IPasswordCipher& cipher)
    : scheme_(scheme)
    , cipher_(cipher) {}

std::string GenerationEngine::PlaintextFileName(const uint32_t index) {
    return std::format("shard-{}{}", index, RecoveryConfig::PLAINTEXT_EXTENSION);
}

std::string GenerationEngine::EncryptedFileName(const uint32_t index) {
    return PlaintextFileName(index) + std::string(RecoveryConfig::ENCRYPTED_EXTENSION);
}

std::string GenerationEngine::FormatShardFile(
    const uint32_t index,
    const uint32_t total,
    const uint32_t threshold,
    std::string_view token,
    std::string_view generated_at) {
    const std::string separator(kSeparatorWidth, '=');
    return std::format(
        "Secret shard {} of {}\n"
        "{}\n"
        "\n"
        "Shard content:\n"
        "{}\n"
        "\n"
        "{}\n"
        "Generated: {}\n"
        "\n"
        "Safety tips:\n"
        "- Keep this file in a secure location\n"
        "- Never share shards with people you do not trust\n"
        "- Any {} of the {} shards recover the original secret\n",
        index, total, separator, token, separator, generated_at, threshold, total);
}

Result<GenerationResult, RecoveryFailure> GenerationEngine::Generate(
    std::string_view secret_text,
    const uint32_t total,
    const uint32_t threshold,
    const GenerationOptions& options) const {
    if (total > Constants::MAX_TOTAL_SHARDS) {
        return GenerateResult::Err(RecoveryFailure::InvalidInput(
            std::format("Total shard count {} exceeds the maximum of {}", total, Constants::MAX_TOTAL_SHARDS)));
    }
    if (threshold < Constants::MIN_THRESHOLD) {
        return GenerateResult::Err(RecoveryFailure::InvalidInput(
            std::format("Threshold {} is below the minimum of {}", threshold, Constants::MIN_THRESHOLD)));
    }
    if (threshold > total) {
        return GenerateResult::Err(RecoveryFailure::InvalidInput(
            std::format("Threshold {} exceeds total shard count {}", threshold, total)));
    }

    auto words = ValidateSecretWords(secret_text, options.vocabulary);
    if (words.IsErr()) {
        return GenerateResult::Err(std::move(words).UnwrapErr());
    }
    if (options.encryption.has_value()) {
        if (auto check = CheckEncryptionPassword(
                options.encryption->password, options.encryption->confirmation);
            check.IsErr()) {
            return GenerateResult::Err(std::move(check).UnwrapErr());
        }
    }
    debug::LogGeneration(total, threshold, options.encryption.has_value());

    std::string secret = NormalizeSecret(words.Unwrap());
    Result<std::vector<std::vector<uint8_t>>, RecoveryFailure> split =
        Result<std::vector<std::vector<uint8_t>>, RecoveryFailure>::Err(RecoveryFailure::Generic("not split"));
    try {
        split = scheme_.Split(
            std::span(reinterpret_cast<const uint8_t*>(secret.data()), secret.size()),
            static_cast<uint8_t>(total),
            static_cast<uint8_t>(threshold));
    } catch (const std::exception& ex) {
        split = Result<std::vector<std::vector<uint8_t>>, RecoveryFailure>::Err(
            RecoveryFailure::Generic(std::format("Splitting raised: {}", ex.what())));
    }
    auto _wipe_secret = SodiumInterop::SecureWipe(secret);
    (void)_wipe_secret;
    if (split.IsErr()) {
        return GenerateResult::Err(std::move(split).UnwrapErr());
    }
    auto& raw_shares = split.Unwrap();
    if (raw_shares.size() != total) {
        return GenerateResult::Err(RecoveryFailure::Generic(
            std::format("Splitting produced {} shares, expected {}", raw_shares.size(), total)));
    }

    const std::string generated_at = options.generated_at.empty()
        ? CurrentTimestamp()
        : options.generated_at;

    GenerationResult result{.total = total, .threshold = threshold, .shards = {}};
    result.shards.reserve(total);
    for (uint32_t i = 0; i < total; ++i) {
        const uint32_t index = i + 1;
        auto token = shards::ShareCodec::Encode(shards::ShardRecord{
            .index = index,
            .threshold = threshold,
            .total = total,
            .payload = std::move(raw_shares[i])
        });
        if (token.IsErr()) {
            return GenerateResult::Err(std::move(token).UnwrapErr());
        }

        GeneratedShard shard{
            .index = index,
            .token = std::move(token).Unwrap(),
            .plaintext_file = {},
            .encrypted_file = std::nullopt
        };
        shard.plaintext_file = ExportFile{
            .name = PlaintextFileName(index),
            .content = ToBytes(FormatShardFile(index, total, threshold, shard.token, generated_at))
        };

        if (options.encryption.has_value()) {
            Result<std::vector<uint8_t>, RecoveryFailure> sealed =
                Result<std::vector<uint8_t>, RecoveryFailure>::Err(RecoveryFailure::Generic("not sealed"));
            try {
                sealed = cipher_.Encrypt(shard.token, options.encryption->password);
            } catch (const std::exception& ex) {
                sealed = Result<std::vector<uint8_t>, RecoveryFailure>::Err(
                    RecoveryFailure::Encryption(ex.what()));
            }
            if (sealed.IsErr()) {
                auto failure = std::move(sealed).UnwrapErr();
                return GenerateResult::Err(RecoveryFailure::Encryption(
                    std::format("Failed to encrypt shard {}: {}", index, failure.message)));
            }
            auto packet = std::move(sealed).Unwrap();
            shard.encrypted_file = ExportFile{
                .name = EncryptedFileName(index),
                .content = options.encryption->encoding == ArtifactEncoding::Armored
                    ? ToBytes(crypto::Armor::Wrap(packet))
                    : std::move(packet)
            };
        }
        result.shards.push_back(std::move(shard));
    }
    return GenerateResult::Ok(std::move(result));
}
}
