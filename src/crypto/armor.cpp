#include "shardvault/crypto/armor.hpp"
#include "shardvault/crypto/sodium_interop.hpp"
#include "shardvault/core/constants.hpp"
#include <algorithm>
#include <format>

namespace shardvault::crypto {
namespace {
    using UnwrapResult = Result<std::vector<uint8_t>, RecoveryFailure>;

    std::string_view TrimLine(std::string_view line) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
            line.remove_suffix(1);
        }
        while (!line.empty() && (line.front() == ' ' || line.front() == '\t')) {
            line.remove_prefix(1);
        }
        return line;
    }

    std::vector<std::string_view> SplitLines(std::string_view text) {
        std::vector<std::string_view> lines;
        size_t start = 0;
        while (start <= text.size()) {
            const size_t end = text.find('\n', start);
            if (end == std::string_view::npos) {
                lines.push_back(TrimLine(text.substr(start)));
                break;
            }
            lines.push_back(TrimLine(text.substr(start, end - start)));
            start = end + 1;
        }
        return lines;
    }

    bool IsHeaderLine(std::string_view line) {
        const size_t colon = line.find(": ");
        return colon != std::string_view::npos && colon > 0 &&
               line.substr(0, colon).find_first_of(" \t") == std::string_view::npos;
    }
}

std::string Armor::Wrap(std::span<const uint8_t> packet) {
    const std::string body = SodiumInterop::ToBase64(packet);
    std::string armored;
    armored.reserve(body.size() + body.size() / ArmorConstants::LINE_WIDTH + 128);
    armored.append(ArmorConstants::BEGIN_LINE).push_back('\n');
    armored.append(ArmorConstants::VERSION_HEADER).push_back('\n');
    armored.push_back('\n');
    for (size_t offset = 0; offset < body.size(); offset += ArmorConstants::LINE_WIDTH) {
        armored.append(body, offset, ArmorConstants::LINE_WIDTH).push_back('\n');
    }
    armored.append(ArmorConstants::END_LINE).push_back('\n');
    return armored;
}

Result<std::vector<uint8_t>, RecoveryFailure> Armor::Unwrap(std::string_view text) {
    const auto lines = SplitLines(text);
    const auto begin = std::find(lines.begin(), lines.end(), ArmorConstants::BEGIN_LINE);
    if (begin == lines.end()) {
        return UnwrapResult::Err(RecoveryFailure::StructuralDecode("Armor header line not found"));
    }
    const auto end = std::find(begin + 1, lines.end(), ArmorConstants::END_LINE);
    if (end == lines.end()) {
        return UnwrapResult::Err(RecoveryFailure::StructuralDecode("Armor footer line not found"));
    }

    auto body_begin = begin + 1;
    if (body_begin != end && IsHeaderLine(*body_begin)) {
        while (body_begin != end && !body_begin->empty()) {
            if (!IsHeaderLine(*body_begin)) {
                return UnwrapResult::Err(RecoveryFailure::StructuralDecode(
                    "Armor header block is not terminated by a blank line"));
            }
            ++body_begin;
        }
    }

    std::string body;
    for (auto it = body_begin; it != end; ++it) {
        body.append(*it);
    }
    if (body.empty()) {
        return UnwrapResult::Err(RecoveryFailure::StructuralDecode("Armor body is empty"));
    }
    if (SodiumInterop::Initialize().IsErr()) {
        return UnwrapResult::Err(
            RecoveryFailure::Generic(std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }
    return SodiumInterop::FromBase64(body).MapErr([](const SodiumFailure& failure) {
        return RecoveryFailure::StructuralDecode(
            std::format("Armor body is not base64: {}", failure.message));
    });
}

bool Armor::ContainsHeader(std::string_view text) noexcept {
    return text.find(ArmorConstants::BEGIN_LINE) != std::string_view::npos;
}

bool Armor::StartsWithHeader(std::span<const uint8_t> bytes) noexcept {
    const std::string_view header = ArmorConstants::BEGIN_LINE;
    if (bytes.size() < header.size()) {
        return false;
    }
    return std::equal(header.begin(), header.end(), bytes.begin(),
        [](const char expected, const uint8_t actual) {
            return static_cast<uint8_t>(expected) == actual;
        });
}
}
