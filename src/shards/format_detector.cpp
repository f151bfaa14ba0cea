#include "shardvault/shards/format_detector.hpp"
#include "shardvault/shards/share_codec.hpp"
#include "shardvault/crypto/armor.hpp"
#include "shardvault/core/constants.hpp"
#include "shardvault/core/overloaded.hpp"
#include "shardvault/debug/trace_log.hpp"

namespace shardvault::shards {
using crypto::Armor;
namespace {
    constexpr std::string_view kWhitespace = " \t\r\n\f\v";

    std::string_view Trim(std::string_view text) {
        const size_t first = text.find_first_not_of(kWhitespace);
        if (first == std::string_view::npos) {
            return {};
        }
        const size_t last = text.find_last_not_of(kWhitespace);
        return text.substr(first, last - first + 1);
    }

    std::vector<std::string_view> NonEmptyLines(std::string_view text) {
        std::vector<std::string_view> lines;
        size_t start = 0;
        while (start < text.size()) {
            size_t end = text.find('\n', start);
            if (end == std::string_view::npos) {
                end = text.size();
            }
            const auto line = Trim(text.substr(start, end - start));
            if (!line.empty()) {
                lines.push_back(line);
            }
            start = end + 1;
        }
        return lines;
    }
}

std::string_view ClassName(const InputClass& input_class) noexcept {
    return std::visit(Overloaded{
        [](const PlaintextShard&) { return std::string_view("plaintext"); },
        [](const ArmoredPayload&) { return std::string_view("armored"); },
        [](const BinaryPayload&) { return std::string_view("binary"); },
        [](const UnrecognizedPayload&) { return std::string_view("unrecognized"); },
    }, input_class);
}

FormatDetector::FormatDetector(const configuration::RecoveryConfig& config) noexcept
    : short_text_limit_(config.GetShortTextLimit()) {}

std::optional<ShardRecord> FormatDetector::DecodeShardText(
    std::string_view text,
    std::optional<uint32_t>* threshold_hint,
    std::string* first_error) {
    const auto note_failure = [&](std::string_view candidate, const RecoveryFailure& failure) {
        if (first_error != nullptr && first_error->empty()) {
            *first_error = failure.message;
        }
        if (threshold_hint != nullptr && !threshold_hint->has_value()) {
            *threshold_hint = ShareCodec::PeekThreshold(candidate);
        }
    };

    const auto trimmed = Trim(text);
    if (trimmed.empty()) {
        if (first_error != nullptr && first_error->empty()) {
            *first_error = "Input is empty";
        }
        return std::nullopt;
    }
    auto whole = ShareCodec::Decode(trimmed);
    if (whole.IsOk()) {
        return std::move(whole).Unwrap();
    }
    note_failure(trimmed, whole.UnwrapErr());

    const auto lines = NonEmptyLines(trimmed);
    if (lines.size() < 2) {
        return std::nullopt;
    }
    for (const auto line : lines) {
        auto decoded = ShareCodec::Decode(line);
        if (decoded.IsOk()) {
            return std::move(decoded).Unwrap();
        }
        note_failure(line, decoded.UnwrapErr());
    }
    return std::nullopt;
}

std::optional<InputClass> FormatDetector::ProbeBinary(std::span<const uint8_t> bytes) {
    if (bytes.empty()) {
        return std::nullopt;
    }
    if (Armor::StartsWithHeader(bytes)) {
        return InputClass(ArmoredPayload{std::vector<uint8_t>(bytes.begin(), bytes.end())});
    }
    if ((bytes.front() & SealConstants::HIGH_BIT_MASK) != 0) {
        return InputClass(BinaryPayload{std::vector<uint8_t>(bytes.begin(), bytes.end())});
    }
    return std::nullopt;
}

bool FormatDetector::HasControlCharacters(std::string_view text) noexcept {
    for (const char c : text) {
        const auto byte = static_cast<uint8_t>(c);
        if (byte <= 0x08 || (byte >= 0x0E && byte <= 0x1F) || byte == 0x7F) {
            return true;
        }
    }
    return false;
}

InputClass FormatDetector::Classify(const RawInput& input) const {
    const std::string_view text = input.AsText();
    InputClass result = UnrecognizedPayload{};

    if (input.content_kind == ContentKind::Text) {
        std::optional<uint32_t> hint;
        std::string first_error;
        if (auto record = DecodeShardText(text, &hint, &first_error); record.has_value()) {
            result = PlaintextShard{std::move(*record)};
        } else if (Armor::ContainsHeader(text)) {
            result = ArmoredPayload{input.content};
        } else {
            const auto trimmed = Trim(text);
            std::optional<InputClass> probed;
            if (trimmed.size() < short_text_limit_ || HasControlCharacters(text)) {
                probed = ProbeBinary(input.Bytes());
            }
            if (probed.has_value()) {
                result = std::move(*probed);
            } else {
                result = UnrecognizedPayload{
                    .reason = first_error.empty()
                        ? std::string(ErrorMessages::FORMAT_NOT_RECOGNIZED)
                        : std::string(ErrorMessages::FORMAT_NOT_RECOGNIZED) + ": " + first_error,
                    .threshold_hint = hint
                };
            }
        }
    } else if (Armor::ContainsHeader(text)) {
        result = ArmoredPayload{input.content};
    } else if (auto probed = ProbeBinary(input.Bytes()); probed.has_value()) {
        result = std::move(*probed);
    } else {
        result = UnrecognizedPayload{
            .reason = std::string(ErrorMessages::FORMAT_NOT_RECOGNIZED),
            .threshold_hint = std::nullopt
        };
    }

    debug::LogClassification(input.source, ClassName(result));
    return result;
}
}
