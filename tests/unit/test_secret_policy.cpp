#include <catch2/catch_test_macros.hpp>
#include "shardvault/generation/secret_policy.hpp"
#include "shardvault/crypto/sodium_interop.hpp"
#include <set>
#include <string>

using namespace shardvault;
using namespace shardvault::generation;

TEST_CASE("SecretPolicy - Word validation", "[policy][generation]") {
    SECTION("Whitespace is collapsed") {
        auto words = ValidateSecretWords("  alpha\tbravo \n charlie  ");
        REQUIRE(words.IsOk());
        REQUIRE(words.Unwrap() == std::vector<std::string>{"alpha", "bravo", "charlie"});
        REQUIRE(NormalizeSecret(words.Unwrap()) == "alpha bravo charlie");
    }
    SECTION("Empty secret") {
        auto words = ValidateSecretWords(" \n\t ");
        REQUIRE(words.IsErr());
        REQUIRE(words.UnwrapErr().message == "Secret must not be empty");
    }
    SECTION("Duplicates are listed once each, case-insensitively") {
        auto words = ValidateSecretWords("Echo delta echo delta foxtrot ECHO");
        REQUIRE(words.IsErr());
        REQUIRE(words.UnwrapErr().type == RecoveryFailureType::InvalidInput);
        REQUIRE(words.UnwrapErr().message == "Duplicate words detected: echo, delta");
    }
    SECTION("Vocabulary miss names the word position") {
        const std::set<std::string, std::less<>> vocabulary{"abandon", "ability", "able"};
        const VocabularyPredicate in_vocabulary = [&](std::string_view word) {
            return vocabulary.contains(word);
        };
        REQUIRE(ValidateSecretWords("abandon able", in_vocabulary).IsOk());
        auto words = ValidateSecretWords("abandon zebra able", in_vocabulary);
        REQUIRE(words.IsErr());
        REQUIRE(words.UnwrapErr().message == "Word 2 is not in the vocabulary");
    }
}

TEST_CASE("SecretPolicy - Password strength", "[policy][generation]") {
    REQUIRE(AssessPassword("").strength == PasswordStrength::Weak);
    REQUIRE(AssessPassword("abc").strength == PasswordStrength::Weak);
    REQUIRE(AssessPassword("abcdefgh1").strength == PasswordStrength::Medium);
    REQUIRE(AssessPassword("Correct-Horse-42").strength == PasswordStrength::Strong);
    REQUIRE(AssessPassword("Correct-Horse-42").score == 6);
    REQUIRE(StrengthName(PasswordStrength::Medium) == "medium");
}

TEST_CASE("SecretPolicy - Encryption password checks", "[policy][generation]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());

    SECTION("Accepted") {
        REQUIRE(CheckEncryptionPassword("Correct-Horse-42", "Correct-Horse-42").IsOk());
    }
    SECTION("Empty password") {
        REQUIRE(CheckEncryptionPassword("", "").UnwrapErr().message == "Password must not be empty");
    }
    SECTION("Empty confirmation") {
        REQUIRE(CheckEncryptionPassword("Correct-Horse-42", "").UnwrapErr().message ==
                "Password confirmation must not be empty");
    }
    SECTION("Mismatch") {
        REQUIRE(CheckEncryptionPassword("Correct-Horse-42", "Correct-Horse-43").UnwrapErr().message ==
                "Passwords do not match");
    }
    SECTION("Weak") {
        auto result = CheckEncryptionPassword("abc", "abc");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().message.starts_with("Password is too weak"));
    }
}

TEST_CASE("SecretPolicy - Random passwords", "[policy][generation]") {
    auto first = GenerateRandomPassword();
    auto second = GenerateRandomPassword(24);
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());
    REQUIRE(first.Unwrap().size() == 16);
    REQUIRE(second.Unwrap().size() == 24);
    REQUIRE(first.Unwrap() != second.Unwrap().substr(0, 16));
}

TEST_CASE("SecretPolicy - Shard counts typed by a user", "[policy][generation]") {
    SECTION("Plain numbers") {
        REQUIRE(ParseShardCount("5").Unwrap() == 5);
        REQUIRE(ParseShardCount("0").Unwrap() == 0);
        REQUIRE(ParseShardCount("4294967295").Unwrap() == 4294967295u);
    }
    SECTION("Values past 32 bits are rejected rather than wrapped") {
        auto parsed = ParseShardCount("4294967298");
        REQUIRE(parsed.IsErr());
        REQUIRE(parsed.UnwrapErr().type == RecoveryFailureType::InvalidInput);
        REQUIRE(parsed.UnwrapErr().message.ends_with("got \"4294967298\""));
    }
    SECTION("Signs, blanks and trailing text") {
        REQUIRE(ParseShardCount("-1").IsErr());
        REQUIRE(ParseShardCount("+3").IsErr());
        REQUIRE(ParseShardCount("").IsErr());
        REQUIRE(ParseShardCount("3 ").IsErr());
        REQUIRE(ParseShardCount("3of5").IsErr());
    }
}
