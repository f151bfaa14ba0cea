#include <catch2/catch_test_macros.hpp>
#include "shardvault/shards/format_detector.hpp"
#include "shardvault/generation/generation_engine.hpp"
#include "helpers/shard_fixtures.hpp"
#include "shards/shard_token.pb.h"
#include <string>

using namespace shardvault;
using namespace shardvault::shards;
using namespace shardvault::test_helpers;

TEST_CASE("FormatDetector - Plaintext tokens", "[detector][shards]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto tokens = MakeTokens(kSampleSecret, 3, 2);
    const FormatDetector detector;

    SECTION("Bare token") {
        const auto result = detector.Classify(RawInput::FromPastedText("pasted line 1", tokens[0]));
        REQUIRE(std::holds_alternative<PlaintextShard>(result));
        REQUIRE(std::get<PlaintextShard>(result).record.index == 1);
        REQUIRE(ClassName(result) == "plaintext");
    }
    SECTION("Token inside the exported file preamble") {
        const auto file = generation::GenerationEngine::FormatShardFile(
            2, 3, 2, tokens[1], "2026-01-01 00:00:00 UTC");
        const auto result = detector.Classify(PlaintextFile("shard-2.txt", file));
        REQUIRE(std::holds_alternative<PlaintextShard>(result));
        REQUIRE(std::get<PlaintextShard>(result).record.index == 2);
        REQUIRE(std::get<PlaintextShard>(result).record.threshold == 2);
    }
    SECTION("Token with Windows line endings") {
        const auto result = detector.Classify(PlaintextFile("shard-3.txt", tokens[2] + "\r\n"));
        REQUIRE(std::holds_alternative<PlaintextShard>(result));
    }
}

TEST_CASE("FormatDetector - Encrypted artifacts", "[detector][shards]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto tokens = MakeTokens(kSampleSecret, 3, 2);
    const auto cipher = MakeFastCipher();
    const FormatDetector detector;

    SECTION("Armored file") {
        const auto sealed = SealToken(cipher, tokens[0], kSamplePassword, true);
        const auto input = SealedFile("shard-1.txt.svlt", sealed);
        REQUIRE(input.content_kind == ContentKind::Text);
        const auto result = detector.Classify(input);
        REQUIRE(std::holds_alternative<ArmoredPayload>(result));
        REQUIRE(IsEncryptedClass(result));
    }
    SECTION("Armored block pasted with surrounding prose") {
        const auto sealed = SealToken(cipher, tokens[0], kSamplePassword, true);
        const std::string text = "my shard:\n" + std::string(sealed.begin(), sealed.end());
        const auto result = detector.Classify(RawInput::FromPastedText("pasted lines 1-8", text));
        REQUIRE(std::holds_alternative<ArmoredPayload>(result));
    }
    SECTION("Binary file") {
        const auto sealed = SealToken(cipher, tokens[1], kSamplePassword, false);
        const auto input = SealedFile("shard-2.txt.svlt", sealed);
        REQUIRE(input.content_kind == ContentKind::Binary);
        const auto result = detector.Classify(input);
        REQUIRE(std::holds_alternative<BinaryPayload>(result));
        REQUIRE(std::get<BinaryPayload>(result).bytes == sealed);
        REQUIRE(ClassName(result) == "binary");
    }
    SECTION("Short text whose first byte has the high bit set") {
        const auto result = detector.Classify(RawInput::FromPastedText("pasted line 1", "\xC3\xA9t\xC3\xA9"));
        REQUIRE(std::holds_alternative<BinaryPayload>(result));
    }
}

TEST_CASE("FormatDetector - Unrecognized input", "[detector][shards]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const FormatDetector detector;

    SECTION("Empty text") {
        const auto result = detector.Classify(RawInput::FromPastedText("pasted line 1", ""));
        REQUIRE(std::holds_alternative<UnrecognizedPayload>(result));
    }
    SECTION("Long prose") {
        const std::string prose(400, 'x');
        const auto result = detector.Classify(PlaintextFile("notes.txt", prose + " and more words"));
        REQUIRE(std::holds_alternative<UnrecognizedPayload>(result));
        const auto& unrecognized = std::get<UnrecognizedPayload>(result);
        REQUIRE(unrecognized.reason.starts_with(ErrorMessages::FORMAT_NOT_RECOGNIZED));
        REQUIRE_FALSE(unrecognized.threshold_hint.has_value());
    }
    SECTION("Binary without a recognizable packet tag") {
        const std::vector<uint8_t> bytes = {0x01, 0xFF, 0xFE, 0x00, 0x80};
        const auto result = detector.Classify(RawInput::FromFile("junk.txt", bytes, false));
        REQUIRE(std::holds_alternative<UnrecognizedPayload>(result));
    }
    SECTION("Token that parses but fails validation keeps its threshold") {
        proto::shards::ShardToken message;
        message.set_index(8);
        message.set_threshold(4);
        message.set_total(5);
        message.set_payload("abc");
        std::string serialized;
        REQUIRE(message.SerializeToString(&serialized));
        const auto token = SodiumInterop::ToBase64(std::span(
            reinterpret_cast<const uint8_t*>(serialized.data()), serialized.size()));

        const auto result = detector.Classify(RawInput::FromPastedText("pasted line 1", token));
        REQUIRE(std::holds_alternative<UnrecognizedPayload>(result));
        const auto& unrecognized = std::get<UnrecognizedPayload>(result);
        REQUIRE(unrecognized.threshold_hint == std::optional<uint32_t>(4));
        REQUIRE(unrecognized.reason.find("outside") != std::string::npos);
    }
}

TEST_CASE("FormatDetector - DecodeShardText scans lines", "[detector][shards]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto tokens = MakeTokens(kSampleSecret, 2, 2);

    SECTION("First decodable line wins") {
        const std::string text = "header line\n\n" + tokens[1] + "\n" + tokens[0] + "\n";
        const auto record = FormatDetector::DecodeShardText(text);
        REQUIRE(record.has_value());
        REQUIRE(record->index == 2);
    }
    SECTION("Failure reports the first error") {
        std::string error;
        const auto record = FormatDetector::DecodeShardText("nothing here", nullptr, &error);
        REQUIRE_FALSE(record.has_value());
        REQUIRE_FALSE(error.empty());
    }
}

TEST_CASE("RawInput - UTF-8 validation", "[detector][shards]") {
    const auto bytes = [](std::string_view text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    };
    REQUIRE(IsValidUtf8(bytes("plain ascii")));
    REQUIRE(IsValidUtf8(bytes("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x94\x91")));
    REQUIRE_FALSE(IsValidUtf8(bytes("\xC3")));
    REQUIRE_FALSE(IsValidUtf8(bytes("\xC0\xAF")));
    REQUIRE_FALSE(IsValidUtf8(bytes("\xED\xA0\x80")));
    REQUIRE_FALSE(IsValidUtf8(bytes("\xF4\x90\x80\x80")));
    REQUIRE_FALSE(IsValidUtf8(bytes("\xFF")));
}

TEST_CASE("FormatDetector - Class names cover every alternative", "[detector][shards]") {
    REQUIRE(ClassName(InputClass(PlaintextShard{})) == "plaintext");
    REQUIRE(ClassName(InputClass(ArmoredPayload{})) == "armored");
    REQUIRE(ClassName(InputClass(BinaryPayload{})) == "binary");
    REQUIRE(ClassName(InputClass(UnrecognizedPayload{.reason = "noise"})) == "unrecognized");
    REQUIRE_FALSE(IsEncryptedClass(InputClass(UnrecognizedPayload{})));
    REQUIRE(IsEncryptedClass(InputClass(BinaryPayload{})));
}
