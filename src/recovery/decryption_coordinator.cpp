#include "shardvault/recovery/decryption_coordinator.hpp"
#include "shardvault/crypto/sodium_interop.hpp"
#include "shardvault/core/constants.hpp"
#include "shardvault/debug/trace_log.hpp"
#include <exception>
#include <format>

namespace shardvault::recovery {
using crypto::SodiumInterop;

DecryptionCoordinator::DecryptionCoordinator(
    ShareBatch& batch,
    const interfaces::IPasswordCipher& cipher,
    const configuration::RecoveryConfig& config)
    : batch_(batch)
    , cipher_(cipher)
    , validator_(config)
    , max_passes_(config.GetMaxPasswordAttempts())
    , state_(CoordinatorState::AwaitingPassword)
    , outcome_(DecryptionOutcome::NothingPending)
    , next_kind_(interfaces::PromptKind::Initial)
    , passes_used_(0)
    , decrypted_total_(0)
    , verdict_(validator_.Validate(batch_)) {
    if (CountPending() == 0 || max_passes_ == 0) {
        state_ = CoordinatorState::Finished;
        outcome_ = CountPending() == 0
            ? DecryptionOutcome::NothingPending
            : DecryptionOutcome::RetriesExhausted;
    }
}

size_t DecryptionCoordinator::CountPending() const {
    size_t pending = 0;
    for (const auto& entry : batch_) {
        if (entry.IsPending()) {
            ++pending;
        }
    }
    return pending;
}

std::optional<interfaces::PasswordRequest> DecryptionCoordinator::NextPrompt() const {
    if (state_ != CoordinatorState::AwaitingPassword) {
        return std::nullopt;
    }
    return interfaces::PasswordRequest{
        .kind = next_kind_,
        .attempt = passes_used_ + 1,
        .max_attempts = max_passes_,
        .pending_inputs = CountPending()
    };
}

AttemptResult DecryptionCoordinator::DecryptEntry(
    ClassifiedInput& entry,
    const std::string& password) const {
    Result<std::string, RecoveryFailure> decrypted =
        Result<std::string, RecoveryFailure>::Err(RecoveryFailure::Generic("not attempted"));
    try {
        decrypted = cipher_.Decrypt(entry.raw.Bytes(), password);
    } catch (const std::exception& ex) {
        decrypted = Result<std::string, RecoveryFailure>::Err(
            RecoveryFailure::Generic(std::format("Decryption raised: {}", ex.what())));
    }

    if (decrypted.IsErr()) {
        auto failure = std::move(decrypted).UnwrapErr();
        if (failure.type == RecoveryFailureType::WrongPassword) {
            return AttemptResult::WrongPassword;
        }
        entry.rejection = std::move(failure);
        return AttemptResult::Malformed;
    }

    auto& plaintext = decrypted.Unwrap();
    std::string decode_error;
    auto record = shards::FormatDetector::DecodeShardText(plaintext, nullptr, &decode_error);
    auto _wipe = SodiumInterop::SecureWipe(plaintext);
    (void)_wipe;
    if (!record.has_value()) {
        entry.rejection = RecoveryFailure::StructuralDecode(
            std::format("Decrypted content is not a shard token: {}", decode_error));
        return AttemptResult::Malformed;
    }
    entry.classification = shards::PlaintextShard{std::move(*record)};
    entry.decrypted = true;
    return AttemptResult::Success;
}

DecryptionPassResult DecryptionCoordinator::SubmitPassword(std::string password) {
    DecryptionPassResult pass_result{.verdict = verdict_};
    if (state_ != CoordinatorState::AwaitingPassword) {
        return pass_result;
    }
    if (password.empty()) {
        Cancel();
        pass_result.verdict = verdict_;
        return pass_result;
    }

    ++passes_used_;
    for (size_t i = 0; i < batch_.size(); ++i) {
        auto& entry = batch_[i];
        if (!entry.IsPending()) {
            continue;
        }
        const AttemptResult result = DecryptEntry(entry, password);
        attempts_.push_back({.input_index = i, .pass = passes_used_, .result = result});
        switch (result) {
            case AttemptResult::Success: ++pass_result.decrypted; break;
            case AttemptResult::WrongPassword: ++pass_result.wrong_password; break;
            case AttemptResult::Malformed: ++pass_result.invalidated; break;
        }
    }
    auto _wipe = SodiumInterop::SecureWipe(password);
    (void)_wipe;

    decrypted_total_ += pass_result.decrypted;
    verdict_ = validator_.Validate(batch_);
    pass_result.verdict = verdict_;
    debug::LogDecryptionPass(passes_used_, CountPending(), pass_result.decrypted, pass_result.invalidated);

    const size_t still_pending = CountPending();
    if (IsReady(verdict_) || still_pending == 0) {
        state_ = CoordinatorState::Finished;
        outcome_ = DecryptionOutcome::Completed;
    } else if (passes_used_ >= max_passes_) {
        state_ = CoordinatorState::Finished;
        outcome_ = DecryptionOutcome::RetriesExhausted;
    } else {
        next_kind_ = pass_result.wrong_password > 0
            ? interfaces::PromptKind::RetryAfterWrongPassword
            : interfaces::PromptKind::Initial;
    }
    return pass_result;
}

void DecryptionCoordinator::Cancel() {
    if (state_ != CoordinatorState::AwaitingPassword) {
        return;
    }
    state_ = CoordinatorState::Finished;
    outcome_ = DecryptionOutcome::Cancelled;
    verdict_ = validator_.Validate(batch_);
}

DecryptionReport DecryptionCoordinator::Run(interfaces::IPasswordPrompt& prompt) {
    while (state_ == CoordinatorState::AwaitingPassword) {
        const auto request = NextPrompt();
        auto password = prompt.RequestPassword(*request);
        if (!password.has_value()) {
            Cancel();
            break;
        }
        SubmitPassword(std::move(*password));
    }
    return DecryptionReport{
        .outcome = outcome_,
        .passes = passes_used_,
        .decrypted = decrypted_total_,
        .verdict = verdict_
    };
}
}
