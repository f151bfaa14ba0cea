#include "shardvault/recovery/share_set_validator.hpp"
#include "shardvault/core/constants.hpp"
#include "shardvault/core/overloaded.hpp"
#include "shardvault/debug/trace_log.hpp"
#include <algorithm>
#include <format>

namespace shardvault::recovery {
namespace {
    std::string JoinIndices(const std::vector<uint32_t>& indices) {
        std::string joined;
        for (const auto index : indices) {
            if (!joined.empty()) {
                joined += ", ";
            }
            joined += std::to_string(index);
        }
        return joined;
    }
}

std::string_view VerdictName(const RecoveryVerdict& verdict) noexcept {
    return std::visit(Overloaded{
        [](const verdict::Waiting&) { return std::string_view("Waiting"); },
        [](const verdict::InsufficientShares&) { return std::string_view("InsufficientShares"); },
        [](const verdict::DuplicateIndices&) { return std::string_view("DuplicateIndices"); },
        [](const verdict::InvalidFormat&) { return std::string_view("InvalidFormat"); },
        [](const verdict::PasswordRequired&) { return std::string_view("PasswordRequired"); },
        [](const verdict::Ready&) { return std::string_view("Ready"); },
    }, verdict);
}

std::string DescribeVerdict(const RecoveryVerdict& verdict) {
    return std::visit(Overloaded{
        [](const verdict::Waiting&) {
            return std::string(ErrorMessages::WAITING_FOR_INPUT);
        },
        [](const verdict::InsufficientShares& v) {
            return std::format("{}: have {}, need {}", ErrorMessages::NEED_MORE_SHARDS, v.have, v.need);
        },
        [](const verdict::DuplicateIndices& v) {
            return std::format("{} (index {})", ErrorMessages::SHARDS_CONFLICT, JoinIndices(v.indices));
        },
        [](const verdict::InvalidFormat&) {
            return std::string(ErrorMessages::FORMAT_NOT_RECOGNIZED);
        },
        [](const verdict::PasswordRequired& v) {
            return std::format("{} ({} pending)", ErrorMessages::PASSWORD_REQUIRED, v.pending);
        },
        [](const verdict::Ready& v) {
            return std::format("{} valid shards detected ({} required), ready to recover",
                v.usable, v.threshold);
        },
    }, verdict);
}

RecoveryFailure VerdictToFailure(const RecoveryVerdict& verdict) {
    const std::string message = DescribeVerdict(verdict);
    return std::visit(Overloaded{
        [&](const verdict::Waiting&) { return RecoveryFailure::InvalidInput(message); },
        [&](const verdict::InsufficientShares&) { return RecoveryFailure::InsufficientShares(message); },
        [&](const verdict::DuplicateIndices&) { return RecoveryFailure::DuplicateIndex(message); },
        [&](const verdict::InvalidFormat&) { return RecoveryFailure::UnrecognizedFormat(message); },
        [&](const verdict::PasswordRequired&) { return RecoveryFailure::PasswordRequired(message); },
        [&](const verdict::Ready&) { return RecoveryFailure::Generic(message); },
    }, verdict);
}

ShareSetValidator::ShareSetValidator(const configuration::RecoveryConfig& config) noexcept
    : consensus_(config.GetDefaultThreshold()) {}

uint32_t ShareSetValidator::ResolveThreshold(const ShareBatch& batch) const {
    const auto candidates = ThresholdConsensus::CandidatesFrom(batch);
    return consensus_.Resolve(candidates);
}

std::optional<RecoveryFailure> ShareSetValidator::CheckThresholdAgreement(const ShareBatch& batch) const {
    const auto candidates = ThresholdConsensus::CandidatesFrom(batch);
    return consensus_.CheckAgreement(candidates);
}

RecoveryVerdict ShareSetValidator::Validate(const ShareBatch& batch) const {
    if (batch.empty()) {
        return verdict::Waiting{};
    }

    size_t usable = 0;
    size_t pending = 0;
    for (const auto& entry : batch) {
        if (entry.IsUsable()) {
            ++usable;
        } else if (entry.IsPending()) {
            ++pending;
        }
    }

    const uint32_t threshold = ResolveThreshold(batch);
    RecoveryVerdict result;
    if (usable == 0 && pending == 0) {
        result = verdict::InvalidFormat{.unrecognized = batch.size()};
    } else if (usable == 0) {
        result = verdict::PasswordRequired{.pending = pending};
    } else {
        std::vector<uint32_t> seen;
        std::vector<uint32_t> duplicates;
        for (const auto& entry : batch) {
            const auto* record = entry.Record();
            if (record == nullptr) {
                continue;
            }
            if (std::find(seen.begin(), seen.end(), record->index) != seen.end()) {
                if (std::find(duplicates.begin(), duplicates.end(), record->index) == duplicates.end()) {
                    duplicates.push_back(record->index);
                }
            } else {
                seen.push_back(record->index);
            }
        }

        if (!duplicates.empty()) {
            result = verdict::DuplicateIndices{.indices = std::move(duplicates)};
        } else if (usable < threshold) {
            result = verdict::InsufficientShares{.have = usable, .need = threshold};
        } else {
            result = verdict::Ready{.usable = usable, .threshold = threshold};
        }
    }

    if (const auto mismatch = CheckThresholdAgreement(batch); mismatch.has_value()) {
        SV_TRACE_MSG(debug::Stage::Validation, mismatch->message.c_str());
    }
    debug::LogVerdict(VerdictName(result), usable, threshold);
    return result;
}
}
