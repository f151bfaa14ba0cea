/**
 * @file shard_tool.cpp
 * @brief Command line front end: split a secret into shard files, recover it from them
 *
 *   shard_tool split <total> <threshold> [--encrypt] [--binary] [--out <dir>]
 *   shard_tool recover <file>...
 */

#include "shardvault/crypto/password_cipher.hpp"
#include "shardvault/crypto/shamir_secret_sharing.hpp"
#include "shardvault/crypto/sodium_interop.hpp"
#include "shardvault/generation/generation_engine.hpp"
#include "shardvault/recovery/recovery_engine.hpp"
#include "shardvault/recovery/recovery_session.hpp"

#include <termios.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

using namespace shardvault;

namespace {

std::string ReadHidden(const std::string& label) {
    std::cerr << label << std::flush;
    termios saved{};
    const bool is_tty = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &saved) == 0;
    if (is_tty) {
        termios hidden = saved;
        hidden.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        tcsetattr(STDIN_FILENO, TCSANOW, &hidden);
    }
    std::string line;
    std::getline(std::cin, line);
    if (is_tty) {
        tcsetattr(STDIN_FILENO, TCSANOW, &saved);
        std::cerr << std::endl;
    }
    return line;
}

class TerminalPasswordPrompt final : public interfaces::IPasswordPrompt {
public:
    std::optional<std::string> RequestPassword(const interfaces::PasswordRequest& request) override {
        if (request.kind == interfaces::PromptKind::RetryAfterWrongPassword) {
            std::cerr << "Incorrect password, please try again." << std::endl;
        }
        std::cerr << request.pending_inputs << " encrypted shard(s) pending, attempt "
                  << request.attempt << " of " << request.max_attempts << std::endl;
        auto password = ReadHidden("Password (empty to cancel): ");
        if (password.empty() || !std::cin) {
            return std::nullopt;
        }
        return password;
    }
};

int PrintUsage() {
    std::cerr << "Usage:" << std::endl
              << "  shard_tool split <total> <threshold> [--encrypt] [--binary] [--out <dir>]" << std::endl
              << "  shard_tool recover <file>..." << std::endl;
    return 2;
}

bool WriteFile(const std::filesystem::path& path, const std::vector<uint8_t>& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    return static_cast<bool>(out);
}

int RunSplit(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return PrintUsage();
    }
    auto total = generation::ParseShardCount(args[0]);
    auto threshold = generation::ParseShardCount(args[1]);
    if (total.IsErr() || threshold.IsErr()) {
        std::cerr << (total.IsErr() ? total : threshold).UnwrapErr().message << std::endl;
        return PrintUsage();
    }

    generation::GenerationOptions options;
    std::filesystem::path out_dir = ".";
    bool encrypt = false;
    bool binary = false;
    for (size_t i = 2; i < args.size(); ++i) {
        if (args[i] == "--encrypt") {
            encrypt = true;
        } else if (args[i] == "--binary") {
            binary = true;
        } else if (args[i] == "--out" && i + 1 < args.size()) {
            out_dir = args[++i];
        } else {
            return PrintUsage();
        }
    }

    std::cerr << "Secret (one line): " << std::flush;
    std::string secret;
    std::getline(std::cin, secret);

    if (encrypt) {
        generation::EncryptionRequest request;
        request.password = ReadHidden("Encryption password: ");
        request.confirmation = ReadHidden("Confirm password: ");
        request.encoding = binary ? generation::ArtifactEncoding::Binary : generation::ArtifactEncoding::Armored;
        const auto assessment = generation::AssessPassword(request.password);
        std::cerr << "Password strength: " << generation::StrengthName(assessment.strength) << std::endl;
        options.encryption = std::move(request);
    }

    crypto::ShamirSecretSharing scheme;
    crypto::PasswordCipher cipher;
    generation::GenerationEngine engine(scheme, cipher);
    auto generated = engine.Generate(secret, total.Unwrap(), threshold.Unwrap(), options);
    auto _wipe = crypto::SodiumInterop::SecureWipe(secret);
    (void)_wipe;
    if (generated.IsErr()) {
        std::cerr << "Error: " << generated.UnwrapErr().message << std::endl;
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    const auto& result = generated.Unwrap();
    for (const auto& shard : result.shards) {
        std::cout << shard.token << std::endl;
        if (!WriteFile(out_dir / shard.plaintext_file.name, shard.plaintext_file.content)) {
            std::cerr << "Failed to write " << shard.plaintext_file.name << std::endl;
            return 1;
        }
        if (shard.encrypted_file.has_value() &&
            !WriteFile(out_dir / shard.encrypted_file->name, shard.encrypted_file->content)) {
            std::cerr << "Failed to write " << shard.encrypted_file->name << std::endl;
            return 1;
        }
    }
    std::cerr << "Wrote " << result.shards.size() << " shards to " << out_dir.string()
              << " (any " << result.threshold << " recover the secret)" << std::endl;
    return 0;
}

int RunRecover(const std::vector<std::string>& files) {
    if (files.empty()) {
        return PrintUsage();
    }
    recovery::RecoverySession session;
    for (const auto& file : files) {
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            std::cerr << "Cannot open " << file << std::endl;
            continue;
        }
        std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        auto added = session.AddFile(std::filesystem::path(file).filename().string(), std::move(bytes));
        if (added.IsErr()) {
            std::cerr << added.UnwrapErr().message << std::endl;
        }
    }
    std::cerr << recovery::DescribeVerdict(session.GetVerdict()) << std::endl;
    if (session.GetThresholdNote().has_value()) {
        std::cerr << "Warning: " << session.GetThresholdNote()->message << std::endl;
    }

    crypto::ShamirSecretSharing scheme;
    crypto::PasswordCipher cipher;
    recovery::RecoveryEngine engine(scheme, cipher, session.GetConfig());
    TerminalPasswordPrompt prompt;
    auto recovered = engine.Recover(session, prompt);
    if (recovered.IsErr()) {
        std::cerr << "Error: " << recovered.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto& secret = recovered.Unwrap();
    std::cerr << "Recovered from " << secret.threshold << " of " << secret.usable_shards
              << " usable shards (" << secret.decrypted_shards << " decrypted)" << std::endl;
    std::cout << secret.secret << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        return PrintUsage();
    }
    if (crypto::SodiumInterop::Initialize().IsErr()) {
        std::cerr << "Failed to initialize libsodium" << std::endl;
        return 1;
    }
    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);
    if (command == "split") {
        return RunSplit(args);
    }
    if (command == "recover") {
        return RunRecover(args);
    }
    return PrintUsage();
}
