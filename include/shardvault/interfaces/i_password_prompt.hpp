#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
namespace shardvault::interfaces {
enum class PromptKind : uint8_t {
    Initial,
    RetryAfterWrongPassword
};
struct PasswordRequest {
    PromptKind kind;
    uint32_t attempt;
    uint32_t max_attempts;
    size_t pending_inputs;
};
/// Interactive password source. Returning std::nullopt cancels the
/// current decryption pass.
class IPasswordPrompt {
public:
    virtual ~IPasswordPrompt() = default;
    [[nodiscard]] virtual std::optional<std::string> RequestPassword(const PasswordRequest& request) = 0;
};
}
