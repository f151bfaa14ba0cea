#include "shardvault/recovery/recovery_session.hpp"
#include "shardvault/core/constants.hpp"
#include "shardvault/shards/share_codec.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <span>
#include <utility>

namespace shardvault::recovery {
using configuration::RecoveryConfig;
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

    bool EndsWithIgnoreCase(std::string_view text, std::string_view suffix) {
        if (text.size() < suffix.size()) {
            return false;
        }
        return std::equal(suffix.rbegin(), suffix.rend(), text.rbegin(),
            [](const char a, const char b) {
                return std::tolower(static_cast<unsigned char>(a)) ==
                       std::tolower(static_cast<unsigned char>(b));
            });
    }

    struct PastedLine {
        size_t number;
        std::string_view text;
    };

    std::string JoinBlock(std::span<const PastedLine> lines) {
        std::string block;
        for (const auto& line : lines) {
            block.append(line.text).push_back('\n');
        }
        return block;
    }

    size_t LastNonEmptyLine(std::span<const PastedLine> lines) {
        for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
            if (!it->text.empty()) {
                return it->number;
            }
        }
        return lines.front().number;
    }

    // An armored block runs from its BEGIN line to the matching END line. A block
    // that is never closed stops before the first line that is a shard token on
    // its own, so tokens pasted after a broken block stay separate candidates.
    std::vector<std::pair<std::string, std::string>> SplitPastedText(std::string_view text) {
        std::vector<PastedLine> lines;
        size_t start = 0;
        while (start < text.size()) {
            size_t end = text.find('\n', start);
            if (end == std::string_view::npos) {
                end = text.size();
            }
            lines.push_back({.number = lines.size() + 1, .text = Trim(text.substr(start, end - start))});
            start = end + 1;
        }

        std::vector<std::pair<std::string, std::string>> candidates;
        size_t i = 0;
        while (i < lines.size()) {
            const auto& line = lines[i];
            if (line.text.empty()) {
                ++i;
                continue;
            }
            if (line.text != ArmorConstants::BEGIN_LINE) {
                candidates.emplace_back(std::format("pasted line {}", line.number), std::string(line.text));
                ++i;
                continue;
            }

            const auto footer = std::find_if(lines.begin() + static_cast<std::ptrdiff_t>(i) + 1, lines.end(),
                [](const PastedLine& entry) { return entry.text == ArmorConstants::END_LINE; });
            size_t block_end;
            if (footer != lines.end()) {
                block_end = static_cast<size_t>(footer - lines.begin()) + 1;
            } else {
                block_end = i + 1;
                while (block_end < lines.size() &&
                       (lines[block_end].text.empty() ||
                        shards::ShareCodec::Decode(lines[block_end].text).IsErr())) {
                    ++block_end;
                }
            }
            const auto block = std::span<const PastedLine>(lines).subspan(i, block_end - i);
            candidates.emplace_back(
                std::format("pasted lines {}-{}", line.number, LastNonEmptyLine(block)),
                JoinBlock(block));
            i = block_end;
        }
        return candidates;
    }
}

RecoverySession::RecoverySession(const RecoveryConfig& config)
    : config_(config)
    , detector_(config)
    , validator_(config)
    , verdict_(verdict::Waiting{}) {}

void RecoverySession::SetPastedText(std::string_view text) {
    std::erase_if(batch_, [](const ClassifiedInput& entry) {
        return entry.raw.source_kind == shards::SourceKind::PastedText;
    });

    ShareBatch pasted;
    for (auto& [source, candidate] : SplitPastedText(text)) {
        pasted.push_back(ClassifyInput(
            detector_, shards::RawInput::FromPastedText(std::move(source), candidate)));
    }
    batch_.insert(batch_.begin(),
                  std::make_move_iterator(pasted.begin()),
                  std::make_move_iterator(pasted.end()));
    Revalidate();
}

Result<Unit, RecoveryFailure> RecoverySession::Reject(std::string source, RecoveryFailure failure) {
    rejections_.push_back({.source = std::move(source), .failure = failure});
    return Result<Unit, RecoveryFailure>::Err(std::move(failure));
}

Result<Unit, RecoveryFailure> RecoverySession::AddFile(std::string file_name, std::vector<uint8_t> bytes) {
    const bool encrypted_extension = EndsWithIgnoreCase(file_name, RecoveryConfig::ENCRYPTED_EXTENSION);
    const bool plaintext_extension = EndsWithIgnoreCase(file_name, RecoveryConfig::PLAINTEXT_EXTENSION);
    if (!encrypted_extension && !plaintext_extension) {
        return Reject(file_name, RecoveryFailure::InputRejected(
            std::format("File type not supported: {} (expected {} or {})", file_name,
                RecoveryConfig::PLAINTEXT_EXTENSION, RecoveryConfig::ENCRYPTED_EXTENSION)));
    }
    if (bytes.size() > config_.GetMaxFileSizeBytes()) {
        return Reject(file_name, RecoveryFailure::InputRejected(
            std::format("File too large: {} ({} bytes, limit {})", file_name,
                bytes.size(), config_.GetMaxFileSizeBytes())));
    }
    const bool duplicate = std::any_of(batch_.begin(), batch_.end(), [&](const ClassifiedInput& entry) {
        return entry.raw.source_kind == shards::SourceKind::File && entry.raw.source == file_name;
    });
    if (duplicate) {
        return Reject(file_name, RecoveryFailure::InputRejected(
            std::format("File already added: {}", file_name)));
    }

    batch_.push_back(ClassifyInput(
        detector_,
        shards::RawInput::FromFile(std::move(file_name), std::move(bytes), encrypted_extension)));
    Revalidate();
    return Result<Unit, RecoveryFailure>::Ok(unit);
}

bool RecoverySession::RemoveFile(std::string_view file_name) {
    const auto removed = std::erase_if(batch_, [&](const ClassifiedInput& entry) {
        return entry.raw.source_kind == shards::SourceKind::File && entry.raw.source == file_name;
    });
    Revalidate();
    return removed > 0;
}

void RecoverySession::Clear() {
    batch_.clear();
    rejections_.clear();
    Revalidate();
}

const RecoveryVerdict& RecoverySession::Revalidate() {
    verdict_ = validator_.Validate(batch_);
    threshold_note_ = validator_.CheckThresholdAgreement(batch_);
    return verdict_;
}

size_t RecoverySession::CountUsable() const {
    return static_cast<size_t>(std::count_if(batch_.begin(), batch_.end(),
        [](const ClassifiedInput& entry) { return entry.IsUsable(); }));
}

size_t RecoverySession::CountPending() const {
    return static_cast<size_t>(std::count_if(batch_.begin(), batch_.end(),
        [](const ClassifiedInput& entry) { return entry.IsPending(); }));
}
}
