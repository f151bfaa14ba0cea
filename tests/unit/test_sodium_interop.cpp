#include <catch2/catch_test_macros.hpp>
#include "shardvault/crypto/sodium_interop.hpp"
#include "shardvault/core/constants.hpp"
#include <algorithm>
#include <set>
#include <string>
#include <vector>

using namespace shardvault;
using namespace shardvault::crypto;

TEST_CASE("SodiumInterop - Initialize is idempotent", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    REQUIRE(SodiumInterop::Initialize().IsOk());
    REQUIRE(SodiumInterop::IsInitialized());
}

TEST_CASE("SodiumInterop - Wiping decrypted material", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Decrypted token text") {
        std::string token = "CAIQAxgFIgQBAgMCKAE=";
        REQUIRE(SodiumInterop::SecureWipe(token).IsOk());
        REQUIRE(token.size() == 20);
        REQUIRE(std::all_of(token.begin(), token.end(), [](char c) { return c == '\0'; }));
    }
    SECTION("Derived key buffer") {
        std::vector<uint8_t> key(Constants::AES_KEY_SIZE, 0xA5);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(key)).IsOk());
        REQUIRE(std::all_of(key.begin(), key.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Large reconstructed payload") {
        std::vector<uint8_t> payload(64 * 1024, 0x5A);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(payload)).IsOk());
        REQUIRE(std::all_of(payload.begin(), payload.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Nothing to wipe") {
        std::string empty;
        REQUIRE(SodiumInterop::SecureWipe(empty).IsOk());
    }
}

TEST_CASE("SodiumInterop - Password confirmation compare", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto bytes = [](std::string_view text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    };

    REQUIRE(SodiumInterop::ConstantTimeEquals(bytes("Correct-Horse-42"), bytes("Correct-Horse-42")).Unwrap());
    REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(bytes("Correct-Horse-42"), bytes("Correct-Horse-43")).Unwrap());
    REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(bytes("Correct-Horse-42"), bytes("Correct-Horse")).Unwrap());
}

TEST_CASE("SodiumInterop - Salts, nonces and password characters", "[sodium][crypto][random]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Consecutive salts differ") {
        std::vector<uint8_t> first(SealConstants::SALT_SIZE);
        std::vector<uint8_t> second(SealConstants::SALT_SIZE);
        SodiumInterop::FillRandom(first);
        SodiumInterop::FillRandom(second);
        REQUIRE(first != second);
    }
    SECTION("Empty span is left alone") {
        std::vector<uint8_t> none;
        SodiumInterop::FillRandom(none);
        REQUIRE(none.empty());
    }
    SECTION("Uniform picks stay inside the alphabet and cover it") {
        std::set<uint32_t> seen;
        for (int i = 0; i < 500; ++i) {
            const uint32_t pick = SodiumInterop::RandomUniform(7);
            REQUIRE(pick < 7);
            seen.insert(pick);
        }
        REQUIRE(seen.size() == 7);
    }
}

TEST_CASE("SodiumInterop - Base64 for tokens and armor bodies", "[sodium][crypto][encoding]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Known vector") {
        const std::vector<uint8_t> data = {'s', 'h', 'a', 'r', 'd'};
        REQUIRE(SodiumInterop::ToBase64(data) == "c2hhcmQ=");
        REQUIRE(SodiumInterop::FromBase64("c2hhcmQ=").Unwrap() == data);
    }
    SECTION("Serialized shard bytes survive the text form") {
        const std::vector<uint8_t> serialized = {0x08, 0x02, 0x10, 0x03, 0x18, 0x05, 0x22, 0x04, 0x00, 0xFF, 0x80, 0x02};
        const auto text = SodiumInterop::ToBase64(serialized);
        REQUIRE(text.find_first_of(" \r\n") == std::string::npos);
        REQUIRE(SodiumInterop::FromBase64(text).Unwrap() == serialized);
    }
    SECTION("Armor line breaks are skipped") {
        auto decoded = SodiumInterop::FromBase64("c2hh\r\ncmQ=");
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().size() == 5);
    }
    SECTION("Characters outside the alphabet are rejected") {
        auto decoded = SodiumInterop::FromBase64("c2h*cmQ=");
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == SodiumFailureType::EncodingFailed);
    }
}
