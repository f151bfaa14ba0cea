#include "shardvault/shards/share_codec.hpp"
#include "shardvault/crypto/sodium_interop.hpp"
#include "shardvault/core/constants.hpp"
#include "shards/shard_token.pb.h"
#include <format>

namespace shardvault::shards {
using crypto::SodiumInterop;
namespace {
    using CodecResult = Result<ShardRecord, RecoveryFailure>;

    std::string_view TrimWhitespace(std::string_view text) {
        constexpr std::string_view kWhitespace = " \t\r\n\f\v";
        const size_t first = text.find_first_not_of(kWhitespace);
        if (first == std::string_view::npos) {
            return {};
        }
        const size_t last = text.find_last_not_of(kWhitespace);
        return text.substr(first, last - first + 1);
    }

    Result<proto::shards::ShardToken, RecoveryFailure> ParseToken(std::string_view token) {
        using ParseResult = Result<proto::shards::ShardToken, RecoveryFailure>;
        const std::string_view trimmed = TrimWhitespace(token);
        if (trimmed.empty()) {
            return ParseResult::Err(RecoveryFailure::StructuralDecode("Shard token is empty"));
        }
        if (trimmed.size() > Constants::MAX_TOKEN_LENGTH) {
            return ParseResult::Err(RecoveryFailure::StructuralDecode(
                std::format("Shard token exceeds {} characters", Constants::MAX_TOKEN_LENGTH)));
        }
        if (trimmed.find_first_of(" \t\r\n") != std::string_view::npos) {
            return ParseResult::Err(RecoveryFailure::StructuralDecode(
                "Shard token must be a single word"));
        }
        if (SodiumInterop::Initialize().IsErr()) {
            return ParseResult::Err(
                RecoveryFailure::Generic(std::string(ErrorMessages::SODIUM_INIT_FAILED)));
        }
        auto bytes_result = SodiumInterop::FromBase64(trimmed).MapErr([](const SodiumFailure& failure) {
            return RecoveryFailure::StructuralDecode(
                std::format("Shard token is not base64: {}", failure.message));
        });
        if (bytes_result.IsErr()) {
            return ParseResult::Err(std::move(bytes_result).UnwrapErr());
        }
        const auto& bytes = bytes_result.Unwrap();
        proto::shards::ShardToken message;
        if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
            return ParseResult::Err(RecoveryFailure::StructuralDecode(
                "Shard token payload is not a valid shard message"));
        }
        return ParseResult::Ok(std::move(message));
    }
}

Result<Unit, RecoveryFailure> ShareCodec::CheckInvariants(const ShardRecord& record) {
    if (record.threshold < Constants::MIN_THRESHOLD) {
        return Result<Unit, RecoveryFailure>::Err(RecoveryFailure::StructuralDecode(
            std::format("Threshold {} is below the minimum of {}",
                record.threshold, Constants::MIN_THRESHOLD)));
    }
    if (record.threshold > record.total) {
        return Result<Unit, RecoveryFailure>::Err(RecoveryFailure::StructuralDecode(
            std::format("Threshold {} exceeds total count {}", record.threshold, record.total)));
    }
    if (record.index < 1 || record.index > record.total) {
        return Result<Unit, RecoveryFailure>::Err(RecoveryFailure::StructuralDecode(
            std::format("Shard index {} is outside [1, {}]", record.index, record.total)));
    }
    if (record.payload.empty()) {
        return Result<Unit, RecoveryFailure>::Err(
            RecoveryFailure::StructuralDecode("Shard payload is empty"));
    }
    return Result<Unit, RecoveryFailure>::Ok(unit);
}

Result<std::string, RecoveryFailure> ShareCodec::Encode(const ShardRecord& record) {
    if (auto check = CheckInvariants(record); check.IsErr()) {
        return Result<std::string, RecoveryFailure>::Err(
            RecoveryFailure::InvalidInput(check.UnwrapErr().message));
    }
    if (SodiumInterop::Initialize().IsErr()) {
        return Result<std::string, RecoveryFailure>::Err(
            RecoveryFailure::Generic(std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }
    proto::shards::ShardToken message;
    message.set_index(record.index);
    message.set_threshold(record.threshold);
    message.set_total(record.total);
    message.set_payload(record.payload.data(), record.payload.size());
    message.set_version(Constants::SHARD_TOKEN_VERSION);

    std::string serialized;
    if (!message.SerializeToString(&serialized)) {
        return Result<std::string, RecoveryFailure>::Err(
            RecoveryFailure::Generic("Failed to serialize shard token"));
    }
    const auto* data = reinterpret_cast<const uint8_t*>(serialized.data());
    return Result<std::string, RecoveryFailure>::Ok(
        SodiumInterop::ToBase64(std::span<const uint8_t>(data, serialized.size())));
}

Result<ShardRecord, RecoveryFailure> ShareCodec::Decode(std::string_view token) {
    auto parsed = ParseToken(token);
    if (parsed.IsErr()) {
        return CodecResult::Err(std::move(parsed).UnwrapErr());
    }
    const auto& message = parsed.Unwrap();
    if (!message.has_index()) {
        return CodecResult::Err(RecoveryFailure::StructuralDecode("Shard token has no numeric index"));
    }
    if (!message.has_threshold()) {
        return CodecResult::Err(RecoveryFailure::StructuralDecode("Shard token has no numeric threshold"));
    }
    if (!message.has_total()) {
        return CodecResult::Err(RecoveryFailure::StructuralDecode("Shard token has no numeric total"));
    }
    if (!message.has_payload()) {
        return CodecResult::Err(RecoveryFailure::StructuralDecode("Shard token has no payload"));
    }

    ShardRecord record{
        .index = message.index(),
        .threshold = message.threshold(),
        .total = message.total(),
        .payload = std::vector<uint8_t>(message.payload().begin(), message.payload().end())
    };
    if (auto check = CheckInvariants(record); check.IsErr()) {
        return CodecResult::Err(std::move(check).UnwrapErr());
    }
    return CodecResult::Ok(std::move(record));
}

std::optional<uint32_t> ShareCodec::PeekThreshold(std::string_view token) {
    auto parsed = ParseToken(token);
    if (parsed.IsErr() || !parsed.Unwrap().has_threshold()) {
        return std::nullopt;
    }
    return parsed.Unwrap().threshold();
}
}
