#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace shardvault {
struct Constants {
    static constexpr uint32_t MIN_THRESHOLD = 2;
    static constexpr uint32_t MAX_TOTAL_SHARDS = 7;
    static constexpr uint32_t DEFAULT_CONSENSUS_THRESHOLD = 3;
    static constexpr uint32_t SHARD_TOKEN_VERSION = 1;
    static constexpr size_t MAX_TOKEN_LENGTH = 64 * 1024;
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct SealConstants {
    static constexpr uint8_t PACKET_TAG = 0xC3;
    static constexpr uint8_t FORMAT_VERSION = 1;
    static constexpr uint8_t KDF_ARGON2ID = 1;
    static constexpr size_t SALT_SIZE = 16;
    static constexpr size_t HEADER_SIZE = 1 + 1 + 1 + 4 + 4 + SALT_SIZE + Constants::AES_GCM_NONCE_SIZE;
    static constexpr uint8_t HIGH_BIT_MASK = 0x80;
};
struct ArmorConstants {
    static constexpr std::string_view BEGIN_LINE = "-----BEGIN SHARDVAULT MESSAGE-----";
    static constexpr std::string_view END_LINE = "-----END SHARDVAULT MESSAGE-----";
    static constexpr std::string_view VERSION_HEADER = "Version: shardvault 1";
    static constexpr size_t LINE_WIDTH = 64;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view NEED_MORE_SHARDS = "Not enough shards to recover the secret";
    static constexpr std::string_view SHARDS_CONFLICT = "Shards conflict: the same shard index appears more than once";
    static constexpr std::string_view WRONG_PASSWORD = "Incorrect password, unable to decrypt shard";
    static constexpr std::string_view FORMAT_NOT_RECOGNIZED = "Shard format not recognized";
    static constexpr std::string_view PASSWORD_REQUIRED = "Encrypted shards detected, a password is required";
    static constexpr std::string_view PASSWORD_CANCELLED = "Password entry cancelled, encrypted shards remain locked";
    static constexpr std::string_view WAITING_FOR_INPUT = "Waiting for shard input";
};
}
