#include <catch2/catch_test_macros.hpp>
#include "shardvault/recovery/threshold_consensus.hpp"
#include "helpers/shard_fixtures.hpp"
#include <vector>

using namespace shardvault;
using namespace shardvault::recovery;
using namespace shardvault::test_helpers;

TEST_CASE("ThresholdConsensus - Resolution order", "[consensus][recovery]") {
    const ThresholdConsensus consensus;

    SECTION("No candidates falls back to the default") {
        REQUIRE(consensus.Resolve({}) == Constants::DEFAULT_CONSENSUS_THRESHOLD);
    }
    SECTION("Candidates without a threshold fall back to the default") {
        const std::vector<ThresholdCandidate> candidates{{std::nullopt, false}, {std::nullopt, false}};
        REQUIRE(consensus.Resolve(candidates) == 3);
    }
    SECTION("First fully decoded candidate wins over a majority") {
        const std::vector<ThresholdCandidate> candidates{
            {4, false}, {4, false}, {2, true}, {5, true}};
        REQUIRE(consensus.Resolve(candidates) == 2);
    }
    SECTION("Majority of hints when nothing decoded fully") {
        const std::vector<ThresholdCandidate> candidates{
            {2, false}, {5, false}, {5, false}};
        REQUIRE(consensus.Resolve(candidates) == 5);
    }
    SECTION("Ties go to the value seen first") {
        const std::vector<ThresholdCandidate> candidates{
            {6, false}, {2, false}, {2, false}, {6, false}};
        REQUIRE(consensus.Resolve(candidates) == 6);
    }
    SECTION("Custom default") {
        const ThresholdConsensus custom(4);
        REQUIRE(custom.GetDefaultThreshold() == 4);
        REQUIRE(custom.Resolve({}) == 4);
    }
}

TEST_CASE("ThresholdConsensus - Candidates from a batch", "[consensus][recovery]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto tokens = MakeTokens(kSampleSecret, 4, 3);
    const shards::FormatDetector detector;

    ShareBatch batch;
    batch.push_back(ClassifyInput(detector, PlaintextFile("a.txt", "not a shard at all, just words")));
    batch.push_back(ClassifyInput(detector, PlaintextFile("b.txt", tokens[0])));
    batch.push_back(ClassifyInput(detector, PlaintextFile("c.txt", tokens[1])));

    SECTION("Decoded shards carry their threshold") {
        const auto candidates = ThresholdConsensus::CandidatesFrom(batch);
        REQUIRE(candidates.size() == 2);
        REQUIRE(candidates[0].fully_decoded);
        REQUIRE(candidates[0].threshold == std::optional<uint32_t>(3));
    }
    SECTION("Rejected entries do not vote") {
        batch[1].rejection = RecoveryFailure::StructuralDecode("bad");
        const auto candidates = ThresholdConsensus::CandidatesFrom(batch);
        REQUIRE(candidates.size() == 1);
    }
}

TEST_CASE("ThresholdConsensus - Disagreement is noted, not fatal", "[consensus][recovery]") {
    const ThresholdConsensus consensus;

    SECTION("Single threshold value") {
        const std::vector<ThresholdCandidate> candidates = {
            {.threshold = 3, .fully_decoded = true},
            {.threshold = 3, .fully_decoded = true}};
        REQUIRE_FALSE(consensus.CheckAgreement(candidates).has_value());
    }
    SECTION("Two threshold values") {
        const std::vector<ThresholdCandidate> candidates = {
            {.threshold = 2, .fully_decoded = false},
            {.threshold = 3, .fully_decoded = true},
            {.threshold = 2, .fully_decoded = false}};
        const auto note = consensus.CheckAgreement(candidates);
        REQUIRE(note.has_value());
        REQUIRE(note->type == RecoveryFailureType::ThresholdMismatch);
        REQUIRE(note->message == "Shards disagree on the threshold (2, 3); using 3");
    }
    SECTION("Candidates without a threshold are ignored") {
        const std::vector<ThresholdCandidate> candidates = {
            {.threshold = std::nullopt, .fully_decoded = false},
            {.threshold = 4, .fully_decoded = true}};
        REQUIRE_FALSE(consensus.CheckAgreement(candidates).has_value());
    }
}
