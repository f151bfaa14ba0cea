#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace shardvault::shards {
enum class ContentKind : uint8_t {
    Text,
    Binary
};

enum class SourceKind : uint8_t {
    PastedText,
    File
};

/**
 * One candidate of a recovery batch: a pasted line (or pasted armored block)
 * or the whole content of one uploaded file.
 */
struct RawInput {
    SourceKind source_kind = SourceKind::PastedText;
    std::string source;
    ContentKind content_kind = ContentKind::Text;
    std::vector<uint8_t> content;
    // Uploaded with the encrypted-artifact extension
    bool expects_encrypted = false;

    [[nodiscard]] static RawInput FromPastedText(std::string source, std::string_view text);

    /// Text if the bytes are valid UTF-8, otherwise Binary.
    [[nodiscard]] static RawInput FromFile(
        std::string file_name,
        std::vector<uint8_t> bytes,
        bool expects_encrypted);

    [[nodiscard]] std::string_view AsText() const noexcept {
        return {reinterpret_cast<const char*>(content.data()), content.size()};
    }

    [[nodiscard]] std::span<const uint8_t> Bytes() const noexcept {
        return content;
    }
};

[[nodiscard]] bool IsValidUtf8(std::span<const uint8_t> bytes) noexcept;
}
