#include "shardvault/recovery/recovery_engine.hpp"
#include "shardvault/recovery/decryption_coordinator.hpp"
#include "shardvault/crypto/sodium_interop.hpp"
#include "shardvault/core/constants.hpp"
#include "shardvault/debug/trace_log.hpp"
#include <algorithm>
#include <exception>
#include <format>

namespace shardvault::recovery {
using crypto::SodiumInterop;
namespace {
    using RecoverResult = Result<RecoveredSecret, RecoveryFailure>;
}

RecoveryEngine::RecoveryEngine(
    const interfaces::ISecretSharingScheme& scheme,
    const interfaces::IPasswordCipher& cipher,
    const configuration::RecoveryConfig& config)
    : scheme_(scheme)
    , cipher_(cipher)
    , config_(config)
    , detector_(config)
    , validator_(config) {}

Result<RecoveredSecret, RecoveryFailure> RecoveryEngine::Recover(
    std::vector<shards::RawInput> inputs,
    interfaces::IPasswordPrompt& prompt) const {
    ShareBatch batch;
    batch.reserve(inputs.size());
    for (auto& input : inputs) {
        batch.push_back(ClassifyInput(detector_, std::move(input)));
    }
    return RecoverBatch(batch, prompt);
}

Result<RecoveredSecret, RecoveryFailure> RecoveryEngine::Recover(
    RecoverySession& session,
    interfaces::IPasswordPrompt& prompt) const {
    auto result = RecoverBatch(session.MutableBatch(), prompt);
    session.Revalidate();
    return result;
}

Result<RecoveredSecret, RecoveryFailure> RecoveryEngine::RecoverBatch(
    ShareBatch& batch,
    interfaces::IPasswordPrompt& prompt) const {
    RecoveryVerdict current = validator_.Validate(batch);
    if (std::holds_alternative<verdict::DuplicateIndices>(current) ||
        std::holds_alternative<verdict::Waiting>(current)) {
        return RecoverResult::Err(VerdictToFailure(current));
    }

    size_t decrypted = 0;
    if (!IsReady(current)) {
        DecryptionCoordinator coordinator(batch, cipher_, config_);
        if (coordinator.GetOutcome() == DecryptionOutcome::NothingPending &&
            coordinator.GetState() == CoordinatorState::Finished) {
            return RecoverResult::Err(VerdictToFailure(current));
        }
        const DecryptionReport report = coordinator.Run(prompt);
        current = report.verdict;
        decrypted = report.decrypted;

        if (!IsReady(current)) {
            if (std::holds_alternative<verdict::DuplicateIndices>(current)) {
                return RecoverResult::Err(VerdictToFailure(current));
            }
            switch (report.outcome) {
                case DecryptionOutcome::Cancelled:
                    return RecoverResult::Err(RecoveryFailure::Cancelled(
                        std::string(ErrorMessages::PASSWORD_CANCELLED)));
                case DecryptionOutcome::RetriesExhausted:
                    return RecoverResult::Err(RecoveryFailure::WrongPassword(
                        std::format("{} ({} of {} attempts used)", ErrorMessages::WRONG_PASSWORD,
                            report.passes, config_.GetMaxPasswordAttempts())));
                default:
                    return RecoverResult::Err(VerdictToFailure(current));
            }
        }
    }

    auto reconstructed = Reconstruct(batch, std::get<verdict::Ready>(current));
    if (reconstructed.IsOk()) {
        reconstructed.Unwrap().decrypted_shards = decrypted;
    }
    return reconstructed;
}

Result<RecoveredSecret, RecoveryFailure> RecoveryEngine::Reconstruct(
    const ShareBatch& batch,
    const verdict::Ready& ready) const {
    std::vector<std::vector<uint8_t>> payloads;
    payloads.reserve(ready.threshold);
    for (const auto& entry : batch) {
        if (payloads.size() == ready.threshold) {
            break;
        }
        if (const auto* record = entry.Record(); record != nullptr) {
            payloads.push_back(record->payload);
        }
    }
    debug::LogCombine(payloads.size(), ready.threshold);

    Result<std::vector<uint8_t>, RecoveryFailure> combined =
        Result<std::vector<uint8_t>, RecoveryFailure>::Err(RecoveryFailure::Generic("not combined"));
    try {
        combined = scheme_.Combine(payloads);
    } catch (const std::exception& ex) {
        combined = Result<std::vector<uint8_t>, RecoveryFailure>::Err(
            RecoveryFailure::Reconstruction(ex.what()));
    }
    for (auto& payload : payloads) {
        auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(payload));
        (void)_wipe;
    }
    if (combined.IsErr()) {
        return RecoverResult::Err(RecoveryFailure::Reconstruction(combined.UnwrapErr().message));
    }

    auto& secret_bytes = combined.Unwrap();
    if (!shards::IsValidUtf8(secret_bytes)) {
        auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(secret_bytes));
        (void)_wipe;
        return RecoverResult::Err(RecoveryFailure::Reconstruction(
            "Reconstructed secret is not valid text; the shards may come from different splits"));
    }
    RecoveredSecret recovered{
        .secret = std::string(secret_bytes.begin(), secret_bytes.end()),
        .usable_shards = ready.usable,
        .threshold = ready.threshold,
        .decrypted_shards = 0
    };
    auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(secret_bytes));
    (void)_wipe;
    return RecoverResult::Ok(std::move(recovered));
}
}
