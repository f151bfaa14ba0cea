#include "shardvault/recovery/threshold_consensus.hpp"
#include <algorithm>
#include <format>
#include <string>
#include <utility>

namespace shardvault::recovery {
ThresholdConsensus::ThresholdConsensus(const uint32_t default_threshold) noexcept
    : default_threshold_(default_threshold) {}

uint32_t ThresholdConsensus::Resolve(std::span<const ThresholdCandidate> candidates) const {
    for (const auto& candidate : candidates) {
        if (candidate.fully_decoded && candidate.threshold.has_value()) {
            return *candidate.threshold;
        }
    }

    // (threshold, votes) in first-seen order
    std::vector<std::pair<uint32_t, size_t>> tally;
    for (const auto& candidate : candidates) {
        if (!candidate.threshold.has_value()) {
            continue;
        }
        auto it = std::find_if(tally.begin(), tally.end(),
            [&](const auto& entry) { return entry.first == *candidate.threshold; });
        if (it == tally.end()) {
            tally.emplace_back(*candidate.threshold, 1);
        } else {
            ++it->second;
        }
    }
    if (tally.empty()) {
        return default_threshold_;
    }
    // max_element keeps the first of equal maxima
    const auto best = std::max_element(tally.begin(), tally.end(),
        [](const auto& a, const auto& b) { return a.second < b.second; });
    return best->first;
}

std::optional<RecoveryFailure> ThresholdConsensus::CheckAgreement(
    std::span<const ThresholdCandidate> candidates) const {
    std::vector<uint32_t> distinct;
    for (const auto& candidate : candidates) {
        if (candidate.threshold.has_value() &&
            std::find(distinct.begin(), distinct.end(), *candidate.threshold) == distinct.end()) {
            distinct.push_back(*candidate.threshold);
        }
    }
    if (distinct.size() < 2) {
        return std::nullopt;
    }
    std::string listed;
    for (const uint32_t threshold : distinct) {
        if (!listed.empty()) {
            listed.append(", ");
        }
        listed.append(std::to_string(threshold));
    }
    return RecoveryFailure::ThresholdMismatch(std::format(
        "Shards disagree on the threshold ({}); using {}", listed, Resolve(candidates)));
}

std::vector<ThresholdCandidate> ThresholdConsensus::CandidatesFrom(const ShareBatch& batch) {
    std::vector<ThresholdCandidate> candidates;
    candidates.reserve(batch.size());
    for (const auto& entry : batch) {
        if (entry.rejection.has_value()) {
            continue;
        }
        if (const auto* record = entry.Record(); record != nullptr) {
            candidates.push_back({.threshold = record->threshold, .fully_decoded = true});
        } else if (const auto* unrecognized =
                       std::get_if<shards::UnrecognizedPayload>(&entry.classification);
                   unrecognized != nullptr && unrecognized->threshold_hint.has_value()) {
            candidates.push_back({.threshold = unrecognized->threshold_hint, .fully_decoded = false});
        }
    }
    return candidates;
}
}
