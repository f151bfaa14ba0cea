#pragma once
#include "shardvault/core/result.hpp"
#include "shardvault/core/failures.hpp"
#include "shardvault/configuration/kdf_profile.hpp"
#include "shardvault/interfaces/i_password_cipher.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace shardvault::crypto {
/**
 * @brief Password sealing of shard tokens (Argon2id + AES-256-GCM)
 *
 * Sealed packet layout (big-endian integers):
 *
 *   offset  size  field
 *   0       1     packet tag 0xC3 (high bit set)
 *   1       1     format version (1)
 *   2       1     KDF id (1 = Argon2id v1.3)
 *   3       4     opslimit
 *   7       4     memlimit in KiB
 *   11      16    salt
 *   27      12    nonce
 *   39      n+16  AES-256-GCM ciphertext || tag
 *
 * The 39-byte header is authenticated as associated data, so tampering with
 * the KDF parameters fails the same way a wrong password does.
 *
 * Encrypt() always returns the binary packet; callers wrap it with Armor when
 * a text artifact is wanted. Decrypt() accepts either form.
 */
class PasswordCipher final : public interfaces::IPasswordCipher {
public:
    explicit PasswordCipher(
        configuration::KdfProfile seal_profile = configuration::KdfProfile::Default(),
        configuration::KdfProfile accepted_ceiling = configuration::KdfProfile::MaxAccepted()) noexcept;

    [[nodiscard]] Result<std::vector<uint8_t>, RecoveryFailure> Encrypt(
        std::string_view plaintext,
        std::string_view password) const override;

    [[nodiscard]] Result<std::string, RecoveryFailure> Decrypt(
        std::span<const uint8_t> sealed,
        std::string_view password) const override;

    [[nodiscard]] const configuration::KdfProfile& GetSealProfile() const noexcept {
        return seal_profile_;
    }

private:
    configuration::KdfProfile seal_profile_;
    configuration::KdfProfile accepted_ceiling_;
};
}
