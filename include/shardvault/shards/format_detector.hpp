#pragma once
#include "shardvault/configuration/recovery_config.hpp"
#include "shardvault/shards/raw_input.hpp"
#include "shardvault/shards/shard_record.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace shardvault::shards {
struct PlaintextShard {
    ShardRecord record;
};

struct ArmoredPayload {
    std::vector<uint8_t> bytes;
};

struct BinaryPayload {
    std::vector<uint8_t> bytes;
};

/// The raw bytes stay on the owning RawInput.
struct UnrecognizedPayload {
    std::string reason;
    // Threshold of a token that parsed but failed validation
    std::optional<uint32_t> threshold_hint;
};

using InputClass = std::variant<PlaintextShard, ArmoredPayload, BinaryPayload, UnrecognizedPayload>;

[[nodiscard]] std::string_view ClassName(const InputClass& input_class) noexcept;

[[nodiscard]] inline bool IsEncryptedClass(const InputClass& input_class) noexcept {
    return std::holds_alternative<ArmoredPayload>(input_class) ||
           std::holds_alternative<BinaryPayload>(input_class);
}

/**
 * Classifies one raw input, first match wins:
 *
 *  1. text that decodes as a shard token (whole content, then line by line)
 *  2. contains the armor BEGIN line                      -> ArmoredPayload
 *  3. binary starting with the armor BEGIN line bytes    -> ArmoredPayload
 *  4. binary whose first byte has the high bit set       -> BinaryPayload
 *  5. text shorter than the short-text limit or holding control
 *     characters is reinterpreted as binary and retried against 3-4
 *  6. otherwise                                          -> UnrecognizedPayload
 */
class FormatDetector {
public:
    explicit FormatDetector(
        const configuration::RecoveryConfig& config = configuration::RecoveryConfig::Default()) noexcept;

    [[nodiscard]] InputClass Classify(const RawInput& input) const;

    /// Rule 1 alone, used on decrypted plaintext
    [[nodiscard]] static std::optional<ShardRecord> DecodeShardText(
        std::string_view text,
        std::optional<uint32_t>* threshold_hint = nullptr,
        std::string* first_error = nullptr);

private:
    [[nodiscard]] static std::optional<InputClass> ProbeBinary(std::span<const uint8_t> bytes);

    [[nodiscard]] static bool HasControlCharacters(std::string_view text) noexcept;

    size_t short_text_limit_;
};
}
