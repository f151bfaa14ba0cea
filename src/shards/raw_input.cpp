#include "shardvault/shards/raw_input.hpp"

namespace shardvault::shards {
RawInput RawInput::FromPastedText(std::string source, std::string_view text) {
    RawInput input;
    input.source_kind = SourceKind::PastedText;
    input.source = std::move(source);
    input.content_kind = ContentKind::Text;
    input.content.assign(text.begin(), text.end());
    return input;
}

RawInput RawInput::FromFile(
    std::string file_name,
    std::vector<uint8_t> bytes,
    const bool expects_encrypted) {
    RawInput input;
    input.source_kind = SourceKind::File;
    input.source = std::move(file_name);
    input.content_kind = IsValidUtf8(bytes) ? ContentKind::Text : ContentKind::Binary;
    input.content = std::move(bytes);
    input.expects_encrypted = expects_encrypted;
    return input;
}

bool IsValidUtf8(std::span<const uint8_t> bytes) noexcept {
    size_t i = 0;
    while (i < bytes.size()) {
        const uint8_t lead = bytes[i];
        size_t continuation;
        uint32_t min_code_point;
        uint32_t code_point;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            continuation = 1;
            min_code_point = 0x80;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            continuation = 2;
            min_code_point = 0x800;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            continuation = 3;
            min_code_point = 0x10000;
            code_point = lead & 0x07;
        } else {
            return false;
        }
        if (i + continuation >= bytes.size()) {
            return false;
        }
        for (size_t k = 1; k <= continuation; ++k) {
            const uint8_t next = bytes[i + k];
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }
        // Overlong forms, surrogates and values past U+10FFFF
        if (code_point < min_code_point || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += continuation + 1;
    }
    return true;
}
}
