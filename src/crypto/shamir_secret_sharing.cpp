#include "shardvault/crypto/shamir_secret_sharing.hpp"
#include "shardvault/crypto/sodium_interop.hpp"
#include <array>
#include <format>
#include <string>
#include <vector>

namespace shardvault::crypto {
namespace {
constexpr uint8_t kPoly = 0x1B;

uint8_t Gf256Mul(uint8_t a, uint8_t b) {
    uint8_t p = 0;
    for (int i = 0; i < 8; ++i) {
        const uint8_t mask = static_cast<uint8_t>(-(static_cast<int>(b & 1u)));
        p ^= a & mask;
        const uint8_t hi = static_cast<uint8_t>(a & 0x80);
        a <<= 1;
        const uint8_t reduction = static_cast<uint8_t>(-(static_cast<int>(hi >> 7))) & kPoly;
        a ^= reduction;
        b >>= 1;
    }
    return p;
}

// a^254 == a^-1 in GF(2^8)
uint8_t Gf256Inv(uint8_t a) {
    if (a == 0) {
        return 0;
    }
    const uint8_t a2 = Gf256Mul(a, a);
    const uint8_t a4 = Gf256Mul(a2, a2);
    const uint8_t a8 = Gf256Mul(a4, a4);
    const uint8_t a16 = Gf256Mul(a8, a8);
    const uint8_t a32 = Gf256Mul(a16, a16);
    const uint8_t a64 = Gf256Mul(a32, a32);
    const uint8_t a128 = Gf256Mul(a64, a64);

    uint8_t result = Gf256Mul(a128, a64);
    result = Gf256Mul(result, a32);
    result = Gf256Mul(result, a16);
    result = Gf256Mul(result, a8);
    result = Gf256Mul(result, a4);
    result = Gf256Mul(result, a2);
    return result;
}

uint8_t EvaluatePolynomial(std::span<const uint8_t> coeffs, const uint8_t x) {
    uint8_t result = 0;
    uint8_t x_power = 1;
    for (const uint8_t coeff : coeffs) {
        result ^= Gf256Mul(coeff, x_power);
        x_power = Gf256Mul(x_power, x);
    }
    return result;
}

using SplitResult = Result<std::vector<std::vector<uint8_t>>, RecoveryFailure>;
using CombineResult = Result<std::vector<uint8_t>, RecoveryFailure>;
}

SplitResult ShamirSecretSharing::Split(
    std::span<const uint8_t> secret,
    const uint8_t share_count,
    const uint8_t threshold) const {
    if (secret.empty()) {
        return SplitResult::Err(RecoveryFailure::InvalidInput("Secret must not be empty"));
    }

    if (secret.size() > MAX_SECRET_LENGTH) {
        return SplitResult::Err(RecoveryFailure::InvalidInput(
            std::format("Secret exceeds maximum length of {} bytes", MAX_SECRET_LENGTH)));
    }

    if (share_count < MIN_SHARES) {
        return SplitResult::Err(RecoveryFailure::InvalidInput("Share count is invalid"));
    }

    if (threshold < MIN_SHARES || threshold > share_count) {
        return SplitResult::Err(RecoveryFailure::InvalidInput("Threshold is invalid"));
    }

    if (SodiumInterop::Initialize().IsErr()) {
        return SplitResult::Err(
            RecoveryFailure::Generic(std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    const size_t share_length = secret.size() + 1;
    std::vector<std::vector<uint8_t>> shares(share_count);
    for (size_t i = 0; i < share_count; ++i) {
        shares[i].assign(share_length, 0);
        shares[i].back() = static_cast<uint8_t>(i + 1);
    }

    std::vector<uint8_t> coeffs(threshold);
    for (size_t byte_index = 0; byte_index < secret.size(); ++byte_index) {
        coeffs[0] = secret[byte_index];
        SodiumInterop::FillRandom(std::span<uint8_t>(coeffs).subspan(1));

        for (size_t share_index = 0; share_index < share_count; ++share_index) {
            const uint8_t x = static_cast<uint8_t>(share_index + 1);
            shares[share_index][byte_index] = EvaluatePolynomial(coeffs, x);
        }
    }
    auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(coeffs));
    (void)_wipe;

    return SplitResult::Ok(std::move(shares));
}

CombineResult ShamirSecretSharing::Combine(
    std::span<const std::vector<uint8_t>> shares) const {
    if (shares.size() < MIN_SHARES) {
        return CombineResult::Err(
            RecoveryFailure::InvalidInput("At least two shares are required"));
    }

    const size_t share_length = shares.front().size();
    if (share_length < 2) {
        return CombineResult::Err(
            RecoveryFailure::InvalidInput("Share is too short"));
    }

    std::array<bool, 256> seen_x{};
    std::vector<uint8_t> x_values;
    x_values.reserve(shares.size());
    for (const auto& share : shares) {
        if (share.size() != share_length) {
            return CombineResult::Err(
                RecoveryFailure::InvalidInput("Shares have different lengths"));
        }
        const uint8_t x = share.back();
        if (x == 0) {
            return CombineResult::Err(
                RecoveryFailure::InvalidInput("Share coordinate is invalid"));
        }
        if (seen_x[x]) {
            return CombineResult::Err(
                RecoveryFailure::InvalidInput("Duplicate share coordinate"));
        }
        seen_x[x] = true;
        x_values.push_back(x);
    }

    // Lagrange basis evaluated at x = 0
    std::vector<uint8_t> lagrange_coeffs(shares.size(), 0);
    for (size_t i = 0; i < shares.size(); ++i) {
        uint8_t numerator = 1;
        uint8_t denominator = 1;
        for (size_t j = 0; j < shares.size(); ++j) {
            if (i == j) {
                continue;
            }
            numerator = Gf256Mul(numerator, x_values[j]);
            denominator = Gf256Mul(denominator, static_cast<uint8_t>(x_values[j] ^ x_values[i]));
        }
        lagrange_coeffs[i] = Gf256Mul(numerator, Gf256Inv(denominator));
    }

    const size_t secret_length = share_length - 1;
    std::vector<uint8_t> secret(secret_length);
    for (size_t byte_index = 0; byte_index < secret_length; ++byte_index) {
        uint8_t value = 0;
        for (size_t i = 0; i < shares.size(); ++i) {
            value ^= Gf256Mul(lagrange_coeffs[i], shares[i][byte_index]);
        }
        secret[byte_index] = value;
    }

    return CombineResult::Ok(std::move(secret));
}
}
