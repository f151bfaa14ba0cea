#include "shardvault/crypto/password_cipher.hpp"
#include "shardvault/crypto/armor.hpp"
#include "shardvault/crypto/sodium_interop.hpp"
#include "shardvault/core/constants.hpp"
#include <sodium.h>
#include <openssl/evp.h>
#include <openssl/err.h>
#include <algorithm>
#include <array>
#include <format>
#include <memory>

namespace shardvault::crypto {
using OpenSSL = OpenSSLConstants;
using configuration::KdfProfile;
namespace {
    using SealResult = Result<std::vector<uint8_t>, RecoveryFailure>;
    using OpenResult = Result<std::string, RecoveryFailure>;
    using DerivedKey = std::array<uint8_t, Constants::AES_KEY_SIZE>;

    constexpr size_t kOpsOffset = 3;
    constexpr size_t kMemOffset = 7;
    constexpr size_t kSaltOffset = 11;
    constexpr size_t kNonceOffset = kSaltOffset + SealConstants::SALT_SIZE;

    static_assert(SealConstants::SALT_SIZE == crypto_pwhash_SALTBYTES);
    static_assert(kNonceOffset + Constants::AES_GCM_NONCE_SIZE == SealConstants::HEADER_SIZE);

    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;

    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    void WriteU32BigEndian(std::span<uint8_t> out, const uint32_t value) {
        out[0] = static_cast<uint8_t>(value >> 24);
        out[1] = static_cast<uint8_t>(value >> 16);
        out[2] = static_cast<uint8_t>(value >> 8);
        out[3] = static_cast<uint8_t>(value);
    }

    uint32_t ReadU32BigEndian(std::span<const uint8_t> in) {
        return (static_cast<uint32_t>(in[0]) << 24) |
               (static_cast<uint32_t>(in[1]) << 16) |
               (static_cast<uint32_t>(in[2]) << 8) |
               static_cast<uint32_t>(in[3]);
    }

    Result<Unit, RecoveryFailure> DeriveKey(
        std::string_view password,
        std::span<const uint8_t> salt,
        const KdfProfile& profile,
        DerivedKey& key) {
        if (crypto_pwhash(
                key.data(), key.size(),
                password.data(), password.size(),
                salt.data(),
                profile.GetOpsLimit(),
                static_cast<size_t>(profile.GetMemLimitBytes()),
                crypto_pwhash_ALG_ARGON2ID13) != 0) {
            return Result<Unit, RecoveryFailure>::Err(
                RecoveryFailure::Encryption("Argon2id key derivation failed (out of memory?)"));
        }
        return Result<Unit, RecoveryFailure>::Ok(unit);
    }

    SealResult GcmSeal(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data) {
        EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return SealResult::Err(RecoveryFailure::Encryption(
                std::format("Failed to create cipher context: {}", GetOpenSSLError())));
        }
        if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS ||
            EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
            return SealResult::Err(RecoveryFailure::Encryption(
                std::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
        }
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen, associated_data.data(),
                              static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return SealResult::Err(RecoveryFailure::Encryption(
                std::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
        std::vector<uint8_t> output(plaintext.size() + Constants::AES_GCM_TAG_SIZE);
        int ciphertext_len = 0;
        if (EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len, plaintext.data(),
                              static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
            return SealResult::Err(RecoveryFailure::Encryption(
                std::format("Encryption failed: {}", GetOpenSSLError())));
        }
        int final_len = 0;
        if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
            return SealResult::Err(RecoveryFailure::Encryption(
                std::format("Encryption finalization failed: {}", GetOpenSSLError())));
        }
        ciphertext_len += final_len;
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                                static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                                output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
            return SealResult::Err(RecoveryFailure::Encryption(
                std::format("Failed to get authentication tag: {}", GetOpenSSLError())));
        }
        output.resize(static_cast<size_t>(ciphertext_len) + Constants::AES_GCM_TAG_SIZE);
        return SealResult::Ok(std::move(output));
    }

    SealResult GcmOpen(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data) {
        const size_t ciphertext_len = ciphertext_with_tag.size() - Constants::AES_GCM_TAG_SIZE;
        const auto ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
        std::array<uint8_t, Constants::AES_GCM_TAG_SIZE> tag{};
        std::copy(ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(ciphertext_len),
                  ciphertext_with_tag.end(), tag.begin());

        EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return SealResult::Err(RecoveryFailure::Generic(
                std::format("Failed to create cipher context: {}", GetOpenSSLError())));
        }
        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS ||
            EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
            return SealResult::Err(RecoveryFailure::Generic(
                std::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
        }
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen, associated_data.data(),
                              static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return SealResult::Err(RecoveryFailure::Generic(
                std::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
        std::vector<uint8_t> output(ciphertext_len);
        int plaintext_len = 0;
        if (EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len, ciphertext.data(),
                              static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
            return SealResult::Err(RecoveryFailure::Generic(
                std::format("Decryption failed: {}", GetOpenSSLError())));
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                                static_cast<int>(tag.size()), tag.data()) != OpenSSL::SUCCESS) {
            return SealResult::Err(RecoveryFailure::Generic(
                std::format("Failed to set authentication tag: {}", GetOpenSSLError())));
        }
        int final_len = 0;
        if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
            auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(output));
            (void)_wipe;
            ERR_clear_error();
            return SealResult::Err(
                RecoveryFailure::WrongPassword(std::string(ErrorMessages::WRONG_PASSWORD)));
        }
        output.resize(static_cast<size_t>(plaintext_len + final_len));
        return SealResult::Ok(std::move(output));
    }
}

PasswordCipher::PasswordCipher(
    const KdfProfile seal_profile,
    const KdfProfile accepted_ceiling) noexcept
    : seal_profile_(seal_profile)
    , accepted_ceiling_(accepted_ceiling) {}

Result<std::vector<uint8_t>, RecoveryFailure> PasswordCipher::Encrypt(
    std::string_view plaintext,
    std::string_view password) const {
    if (password.empty()) {
        return SealResult::Err(RecoveryFailure::InvalidInput("Password must not be empty"));
    }
    if (!seal_profile_.IsWithin(accepted_ceiling_)) {
        return SealResult::Err(RecoveryFailure::InvalidInput(
            "Key derivation profile is outside the accepted range"));
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return SealResult::Err(RecoveryFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    std::vector<uint8_t> packet(SealConstants::HEADER_SIZE);
    packet[0] = SealConstants::PACKET_TAG;
    packet[1] = SealConstants::FORMAT_VERSION;
    packet[2] = SealConstants::KDF_ARGON2ID;
    WriteU32BigEndian(std::span(packet).subspan(kOpsOffset, 4), seal_profile_.GetOpsLimit());
    WriteU32BigEndian(std::span(packet).subspan(kMemOffset, 4), seal_profile_.GetMemLimitKib());
    const auto salt = std::span(packet).subspan(kSaltOffset, SealConstants::SALT_SIZE);
    const auto nonce = std::span(packet).subspan(kNonceOffset, Constants::AES_GCM_NONCE_SIZE);
    SodiumInterop::FillRandom(salt);
    SodiumInterop::FillRandom(nonce);

    DerivedKey key{};
    if (auto derived = DeriveKey(password, salt, seal_profile_, key); derived.IsErr()) {
        return SealResult::Err(std::move(derived).UnwrapErr());
    }
    const auto* text = reinterpret_cast<const uint8_t*>(plaintext.data());
    auto sealed = GcmSeal(
        key, nonce,
        std::span<const uint8_t>(text, plaintext.size()),
        std::span<const uint8_t>(packet.data(), SealConstants::HEADER_SIZE));
    auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(key));
    (void)_wipe;
    if (sealed.IsErr()) {
        return SealResult::Err(std::move(sealed).UnwrapErr());
    }
    const auto& body = sealed.Unwrap();
    packet.insert(packet.end(), body.begin(), body.end());
    return SealResult::Ok(std::move(packet));
}

Result<std::string, RecoveryFailure> PasswordCipher::Decrypt(
    std::span<const uint8_t> sealed,
    std::string_view password) const {
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return OpenResult::Err(RecoveryFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    std::vector<uint8_t> unarmored;
    std::span<const uint8_t> packet = sealed;
    const std::string_view as_text(reinterpret_cast<const char*>(sealed.data()), sealed.size());
    if (Armor::ContainsHeader(as_text)) {
        auto unwrapped = Armor::Unwrap(as_text);
        if (unwrapped.IsErr()) {
            return OpenResult::Err(std::move(unwrapped).UnwrapErr());
        }
        unarmored = std::move(unwrapped).Unwrap();
        packet = unarmored;
    }

    if (packet.size() < SealConstants::HEADER_SIZE + Constants::AES_GCM_TAG_SIZE) {
        return OpenResult::Err(RecoveryFailure::StructuralDecode(
            std::format("Sealed shard is truncated ({} bytes)", packet.size())));
    }
    if (packet[0] != SealConstants::PACKET_TAG) {
        return OpenResult::Err(RecoveryFailure::StructuralDecode(
            std::format("Unknown packet tag 0x{:02X}", packet[0])));
    }
    if (packet[1] != SealConstants::FORMAT_VERSION) {
        return OpenResult::Err(RecoveryFailure::StructuralDecode(
            std::format("Unsupported sealed shard version {}", packet[1])));
    }
    if (packet[2] != SealConstants::KDF_ARGON2ID) {
        return OpenResult::Err(RecoveryFailure::StructuralDecode(
            std::format("Unsupported key derivation id {}", packet[2])));
    }
    const KdfProfile profile(
        ReadU32BigEndian(packet.subspan(kOpsOffset, 4)),
        ReadU32BigEndian(packet.subspan(kMemOffset, 4)));
    if (!profile.IsWithin(accepted_ceiling_)) {
        return OpenResult::Err(RecoveryFailure::StructuralDecode(
            std::format("Key derivation parameters out of range (ops {}, mem {} KiB)",
                profile.GetOpsLimit(), profile.GetMemLimitKib())));
    }

    DerivedKey key{};
    if (auto derived = DeriveKey(
            password, packet.subspan(kSaltOffset, SealConstants::SALT_SIZE), profile, key);
        derived.IsErr()) {
        return OpenResult::Err(std::move(derived).UnwrapErr());
    }
    auto opened = GcmOpen(
        key,
        packet.subspan(kNonceOffset, Constants::AES_GCM_NONCE_SIZE),
        packet.subspan(SealConstants::HEADER_SIZE),
        packet.subspan(0, SealConstants::HEADER_SIZE));
    auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(key));
    (void)_wipe;
    if (opened.IsErr()) {
        return OpenResult::Err(std::move(opened).UnwrapErr());
    }

    auto& plaintext = opened.Unwrap();
    std::string text(plaintext.begin(), plaintext.end());
    auto _wipe_plain = SodiumInterop::SecureWipe(std::span<uint8_t>(plaintext));
    (void)_wipe_plain;
    return OpenResult::Ok(std::move(text));
}
}
