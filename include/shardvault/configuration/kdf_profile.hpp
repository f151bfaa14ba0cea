#pragma once

#include <cstdint>

namespace shardvault::configuration {

/// Argon2id cost parameters used when sealing a shard with a password.
///
/// The parameters travel inside every sealed artifact, so opening always uses
/// the values the artifact was sealed with. MaxAccepted() is the ceiling an
/// artifact may request before it is rejected as malformed.
///
/// @example
/// ```cpp
/// // Desktop export
/// auto profile = KdfProfile::Moderate();
///
/// // Unit tests / constrained devices
/// auto profile = KdfProfile::Minimal();
/// ```
class KdfProfile {
public:
    /// libsodium crypto_pwhash_*_INTERACTIVE (2 passes, 64 MiB)
    [[nodiscard]] static constexpr KdfProfile Interactive() noexcept {
        return KdfProfile(2, 64 * 1024);
    }

    /// libsodium crypto_pwhash_*_MODERATE (3 passes, 256 MiB)
    [[nodiscard]] static constexpr KdfProfile Moderate() noexcept {
        return KdfProfile(3, 256 * 1024);
    }

    /// libsodium crypto_pwhash_*_MIN. Only for tests.
    [[nodiscard]] static constexpr KdfProfile Minimal() noexcept {
        return KdfProfile(1, 8);
    }

    [[nodiscard]] static constexpr KdfProfile MaxAccepted() noexcept {
        return KdfProfile(10, 1024 * 1024);
    }

    [[nodiscard]] static constexpr KdfProfile Default() noexcept {
        return Interactive();
    }

    constexpr KdfProfile(const uint32_t ops_limit, const uint32_t mem_limit_kib) noexcept
        : ops_limit_(ops_limit), mem_limit_kib_(mem_limit_kib) {}

    [[nodiscard]] constexpr uint32_t GetOpsLimit() const noexcept {
        return ops_limit_;
    }

    [[nodiscard]] constexpr uint32_t GetMemLimitKib() const noexcept {
        return mem_limit_kib_;
    }

    [[nodiscard]] constexpr uint64_t GetMemLimitBytes() const noexcept {
        return static_cast<uint64_t>(mem_limit_kib_) * 1024;
    }

    /// True when both limits are inside [Minimal(), ceiling]
    [[nodiscard]] constexpr bool IsWithin(const KdfProfile& ceiling) const noexcept {
        return ops_limit_ >= Minimal().ops_limit_ &&
               mem_limit_kib_ >= Minimal().mem_limit_kib_ &&
               ops_limit_ <= ceiling.ops_limit_ &&
               mem_limit_kib_ <= ceiling.mem_limit_kib_;
    }

    [[nodiscard]] constexpr bool operator==(const KdfProfile& other) const noexcept {
        return ops_limit_ == other.ops_limit_ && mem_limit_kib_ == other.mem_limit_kib_;
    }

    [[nodiscard]] constexpr bool operator!=(const KdfProfile& other) const noexcept {
        return !(*this == other);
    }

private:
    uint32_t ops_limit_;
    uint32_t mem_limit_kib_;
};

} // namespace shardvault::configuration
