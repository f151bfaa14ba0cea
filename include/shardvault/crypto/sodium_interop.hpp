#pragma once

#include "shardvault/core/result.hpp"
#include "shardvault/core/failures.hpp"
#include "shardvault/core/constants.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace shardvault::crypto {

/**
 * @brief Thin interop layer over libsodium
 *
 * Library initialisation, randomness, wiping, constant-time comparison and
 * the base64 codec shared by shard tokens and armored artifacts.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Thread-safe and idempotent. Every entry point that touches libsodium
     * calls this first.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Uses a volatile loop for small buffers and sodium_memzero above
     * Constants::SMALL_BUFFER_THRESHOLD.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Wipe the characters of a string in place (passwords, decrypted tokens)
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::string& text);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different, Err on failure
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static void FillRandom(std::span<uint8_t> buffer);

    /// Uniform value in [0, upper_bound), without modulo bias
    static uint32_t RandomUniform(uint32_t upper_bound);

    // ========================================================================
    // Base64 (standard alphabet, padded)
    // ========================================================================

    static std::string ToBase64(std::span<const uint8_t> data);

    /**
     * @brief Decode standard base64
     *
     * Embedded whitespace (line breaks of armored bodies) is skipped.
     * Anything else outside the alphabet fails.
     */
    static Result<std::vector<uint8_t>, SodiumFailure> FromBase64(std::string_view text);

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace shardvault::crypto
