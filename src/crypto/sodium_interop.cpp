#include "shardvault/crypto/sodium_interop.hpp"

#include <sodium.h>

#include <stdexcept>

namespace shardvault::crypto {

namespace {
constexpr const char* kBase64Ignore = " \t\r\n";
}

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                "Buffer size " + std::to_string(buffer.size()) +
                " exceeds maximum " + std::to_string(MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::string& text) {
    return SecureWipe(std::span<uint8_t>(
        reinterpret_cast<uint8_t*>(text.data()),
        text.size()));
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }

    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }

    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::ComparisonFailed(
                std::string(ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED) +
                ": " + std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    return Result<bool, SodiumFailure>::Ok(
        sodium_memcmp(a.data(), b.data(), a.size()) == 0);
}

// ============================================================================
// Random Number Generation
// ============================================================================

void SodiumInterop::FillRandom(std::span<uint8_t> buffer) {
    if (buffer.empty()) {
        return;
    }
    randombytes_buf(buffer.data(), buffer.size());
}

uint32_t SodiumInterop::RandomUniform(const uint32_t upper_bound) {
    return randombytes_uniform(upper_bound);
}

// ============================================================================
// Base64
// ============================================================================

std::string SodiumInterop::ToBase64(std::span<const uint8_t> data) {
    const size_t encoded_len = sodium_base64_encoded_len(
        data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string encoded(encoded_len, '\0');
    sodium_bin2base64(
        encoded.data(),
        encoded.size(),
        data.data(),
        data.size(),
        sodium_base64_VARIANT_ORIGINAL);
    // encoded_len counts the terminating NUL
    encoded.resize(encoded_len - 1);
    return encoded;
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::FromBase64(std::string_view text) {
    std::vector<uint8_t> decoded(text.size() / 4 * 3 + 3);
    size_t decoded_len = 0;
    const int rc = sodium_base642bin(
        decoded.data(),
        decoded.size(),
        text.data(),
        text.size(),
        kBase64Ignore,
        &decoded_len,
        nullptr,
        sodium_base64_VARIANT_ORIGINAL);
    if (rc != 0) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::EncodingFailed("Input is not valid base64"));
    }
    decoded.resize(decoded_len);
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(decoded));
}

} // namespace shardvault::crypto
