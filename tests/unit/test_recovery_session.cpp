#include <catch2/catch_test_macros.hpp>
#include "shardvault/recovery/recovery_session.hpp"
#include "shardvault/core/constants.hpp"
#include "helpers/shard_fixtures.hpp"
#include <string>
#include <vector>

using namespace shardvault;
using namespace shardvault::recovery;
using namespace shardvault::test_helpers;
using configuration::RecoveryConfig;

TEST_CASE("RecoverySession - Starts waiting", "[session][recovery]") {
    const RecoverySession session;
    REQUIRE(std::holds_alternative<verdict::Waiting>(session.GetVerdict()));
    REQUIRE(session.GetBatch().empty());
    REQUIRE(session.GetConfig() == RecoveryConfig::Default());
}

TEST_CASE("RecoverySession - Pasted text", "[session][recovery]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto tokens = MakeTokens(kSampleSecret, 5, 3);
    RecoverySession session;

    SECTION("Each non-empty line is a candidate") {
        session.SetPastedText(tokens[0] + "\n\n  " + tokens[1] + "  \n" + tokens[2] + "\n");
        REQUIRE(session.GetBatch().size() == 3);
        REQUIRE(session.GetBatch()[0].raw.source == "pasted line 1");
        REQUIRE(session.GetBatch()[1].raw.source == "pasted line 3");
        REQUIRE(session.CountUsable() == 3);
        REQUIRE(IsReady(session.GetVerdict()));
    }
    SECTION("Pasting again replaces earlier paste") {
        session.SetPastedText(tokens[0] + "\n" + tokens[1]);
        session.SetPastedText(tokens[3]);
        REQUIRE(session.GetBatch().size() == 1);
        REQUIRE(session.GetBatch()[0].Record()->index == 4);
    }
    SECTION("Armored block is one candidate") {
        const auto cipher = MakeFastCipher();
        const auto sealed = SealToken(cipher, tokens[0], kSamplePassword, true);
        const std::string armored(sealed.begin(), sealed.end());
        session.SetPastedText(tokens[1] + "\n" + armored);
        REQUIRE(session.GetBatch().size() == 2);
        REQUIRE(session.GetBatch()[1].raw.source.starts_with("pasted lines 2-"));
        REQUIRE(std::holds_alternative<shards::ArmoredPayload>(session.GetBatch()[1].classification));
        REQUIRE(session.CountPending() == 1);
    }
    SECTION("Unterminated armored block does not swallow later tokens") {
        session.SetPastedText(
            std::string(ArmorConstants::BEGIN_LINE) + "\n" +
            "broken*body*line\n" +
            tokens[0] + "\n" +
            tokens[2] + "\n\n" +
            tokens[4] + "\n");
        REQUIRE(session.GetBatch().size() == 4);
        REQUIRE(session.GetBatch()[0].raw.source == "pasted lines 1-2");
        REQUIRE(session.GetBatch()[1].raw.source == "pasted line 3");
        REQUIRE(session.GetBatch()[3].raw.source == "pasted line 6");
        REQUIRE(session.CountUsable() == 3);
        REQUIRE(session.GetVerdict() == RecoveryVerdict(verdict::Ready{.usable = 3, .threshold = 3}));
    }
    SECTION("Clearing the paste leaves files in place") {
        REQUIRE(session.AddFile("shard-3.txt", ToBytes(tokens[2])).IsOk());
        session.SetPastedText(tokens[0]);
        REQUIRE(session.GetBatch().size() == 2);
        REQUIRE(session.GetBatch()[0].raw.source_kind == shards::SourceKind::PastedText);
        session.SetPastedText("");
        REQUIRE(session.GetBatch().size() == 1);
        REQUIRE(session.GetBatch()[0].raw.source == "shard-3.txt");
    }
}

TEST_CASE("RecoverySession - File uploads", "[session][recovery]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto tokens = MakeTokens(kSampleSecret, 3, 2);
    RecoverySession session;

    SECTION("Accepted extensions regardless of case") {
        REQUIRE(session.AddFile("shard-1.TXT", ToBytes(tokens[0])).IsOk());
        REQUIRE(session.AddFile("shard-2.txt.SVLT", ToBytes(tokens[1])).IsOk());
        REQUIRE(session.GetBatch()[1].raw.expects_encrypted);
        REQUIRE(IsReady(session.GetVerdict()));
    }
    SECTION("Unsupported extension is rejected and recorded") {
        auto result = session.AddFile("shard-1.pdf", ToBytes(tokens[0]));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RecoveryFailureType::InputRejected);
        REQUIRE(session.GetBatch().empty());
        REQUIRE(session.GetRejections().size() == 1);
        REQUIRE(session.GetRejections()[0].source == "shard-1.pdf");
    }
    SECTION("Oversized file is rejected") {
        RecoverySession small(RecoveryConfig(16, 3, 3, 200));
        auto result = small.AddFile("shard-1.txt", ToBytes(tokens[0]));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().message.starts_with("File too large"));
    }
    SECTION("Same file name twice is rejected") {
        REQUIRE(session.AddFile("shard-1.txt", ToBytes(tokens[0])).IsOk());
        auto result = session.AddFile("shard-1.txt", ToBytes(tokens[1]));
        REQUIRE(result.IsErr());
        REQUIRE(session.GetBatch().size() == 1);
    }
    SECTION("Same shard under two names is a conflict") {
        REQUIRE(session.AddFile("a.txt", ToBytes(tokens[0])).IsOk());
        REQUIRE(session.AddFile("b.txt", ToBytes(tokens[0])).IsOk());
        REQUIRE(std::holds_alternative<verdict::DuplicateIndices>(session.GetVerdict()));
    }
    SECTION("Removing a file revalidates") {
        REQUIRE(session.AddFile("shard-1.txt", ToBytes(tokens[0])).IsOk());
        REQUIRE(session.AddFile("shard-2.txt", ToBytes(tokens[1])).IsOk());
        REQUIRE(IsReady(session.GetVerdict()));
        REQUIRE(session.RemoveFile("shard-2.txt"));
        REQUIRE_FALSE(session.RemoveFile("shard-2.txt"));
        REQUIRE(std::holds_alternative<verdict::InsufficientShares>(session.GetVerdict()));
    }
    SECTION("Clear drops inputs and rejections") {
        REQUIRE(session.AddFile("shard-1.txt", ToBytes(tokens[0])).IsOk());
        REQUIRE(session.AddFile("shard-1.doc", ToBytes(tokens[0])).IsErr());
        session.Clear();
        REQUIRE(session.GetBatch().empty());
        REQUIRE(session.GetRejections().empty());
        REQUIRE(std::holds_alternative<verdict::Waiting>(session.GetVerdict()));
    }
}

TEST_CASE("RecoverySession - Pasted candidates come before files", "[session][recovery]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto tokens = MakeTokens(kSampleSecret, 3, 2);
    RecoverySession session;
    REQUIRE(session.AddFile("shard-3.txt", ToBytes(tokens[2])).IsOk());
    session.SetPastedText(tokens[0]);
    REQUIRE(session.GetBatch()[0].raw.source == "pasted line 1");
    REQUIRE(session.GetBatch()[1].raw.source == "shard-3.txt");
}

TEST_CASE("RecoverySession - Shards from splits with different thresholds", "[session][recovery]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto three_of_five = MakeTokens(kSampleSecret, 5, 3);
    const auto two_of_three = MakeTokens(kSampleSecret, 3, 2);
    RecoverySession session;

    session.SetPastedText(three_of_five[0] + "\n" + three_of_five[1] + "\n");
    REQUIRE_FALSE(session.GetThresholdNote().has_value());

    REQUIRE(session.AddFile("other.txt", ToBytes(two_of_three[2])).IsOk());
    REQUIRE(session.GetThresholdNote().has_value());
    REQUIRE(session.GetThresholdNote()->type == RecoveryFailureType::ThresholdMismatch);
    REQUIRE(session.GetThresholdNote()->message == "Shards disagree on the threshold (3, 2); using 3");
    REQUIRE(session.GetVerdict() == RecoveryVerdict(verdict::Ready{.usable = 3, .threshold = 3}));

    REQUIRE(session.RemoveFile("other.txt"));
    REQUIRE_FALSE(session.GetThresholdNote().has_value());
}
