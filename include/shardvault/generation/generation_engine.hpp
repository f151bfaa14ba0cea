#pragma once
#include "shardvault/core/result.hpp"
#include "shardvault/core/failures.hpp"
#include "shardvault/generation/secret_policy.hpp"
#include "shardvault/interfaces/i_password_cipher.hpp"
#include "shardvault/interfaces/i_secret_sharing_scheme.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shardvault::generation {
enum class ArtifactEncoding : uint8_t {
    Armored,
    Binary
};

struct EncryptionRequest {
    std::string password;
    std::string confirmation;
    ArtifactEncoding encoding = ArtifactEncoding::Armored;
};

struct GenerationOptions {
    VocabularyPredicate vocabulary;
    std::optional<EncryptionRequest> encryption;
    // Printed in the plaintext file preamble; current UTC time when empty
    std::string generated_at;
};

struct ExportFile {
    std::string name;
    std::vector<uint8_t> content;
};

struct GeneratedShard {
    uint32_t index;
    std::string token;
    ExportFile plaintext_file;
    // Present only when encryption was requested
    std::optional<ExportFile> encrypted_file;
};

struct GenerationResult {
    uint32_t total;
    uint32_t threshold;
    std::vector<GeneratedShard> shards;
};

/**
 * @brief Splits a secret into shard tokens and their export files
 *
 * Preconditions, checked before anything is split:
 *   2 <= threshold <= total <= Constants::MAX_TOTAL_SHARDS
 *   the secret has at least one word and no duplicated word
 *   the encryption password, if any, is not weak and matches its confirmation
 *
 * Plaintext file `shard-<i>.txt`: a readable preamble around the token.
 * Encrypted file `shard-<i>.txt.svlt`: the sealed token and nothing else,
 * armored or binary. The plaintext token is always produced.
 */
class GenerationEngine {
public:
    GenerationEngine(
        const interfaces::ISecretSharingScheme& scheme,
        const interfaces::IPasswordCipher& cipher);

    [[nodiscard]] Result<GenerationResult, RecoveryFailure> Generate(
        std::string_view secret_text,
        uint32_t total,
        uint32_t threshold,
        const GenerationOptions& options = {}) const;

    [[nodiscard]] static std::string PlaintextFileName(uint32_t index);

    [[nodiscard]] static std::string EncryptedFileName(uint32_t index);

    [[nodiscard]] static std::string FormatShardFile(
        uint32_t index,
        uint32_t total,
        uint32_t threshold,
        std::string_view token,
        std::string_view generated_at);

private:
    const interfaces::ISecretSharingScheme& scheme_;
    const interfaces::IPasswordCipher& cipher_;
};
}
