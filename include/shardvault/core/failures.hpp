#pragma once
#include <string>
#include <string_view>
namespace shardvault {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooLarge,
    SecureWipeFailed,
    ComparisonFailed,
    EncodingFailed
};
enum class RecoveryFailureType {
    Generic,
    InvalidInput,
    InputRejected,
    StructuralDecode,
    ThresholdMismatch,
    DuplicateIndex,
    InsufficientShares,
    UnrecognizedFormat,
    PasswordRequired,
    WrongPassword,
    Cancelled,
    Encryption,
    Reconstruction
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure EncodingFailed(std::string msg) {
        return {SodiumFailureType::EncodingFailed, std::move(msg)};
    }
};
class RecoveryFailure {
public:
    RecoveryFailureType type;
    std::string message;
    RecoveryFailure(const RecoveryFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static RecoveryFailure Generic(std::string msg) {
        return {RecoveryFailureType::Generic, std::move(msg)};
    }
    static RecoveryFailure InvalidInput(std::string msg) {
        return {RecoveryFailureType::InvalidInput, std::move(msg)};
    }
    static RecoveryFailure InputRejected(std::string msg) {
        return {RecoveryFailureType::InputRejected, std::move(msg)};
    }
    static RecoveryFailure StructuralDecode(std::string msg) {
        return {RecoveryFailureType::StructuralDecode, std::move(msg)};
    }
    static RecoveryFailure ThresholdMismatch(std::string msg) {
        return {RecoveryFailureType::ThresholdMismatch, std::move(msg)};
    }
    static RecoveryFailure DuplicateIndex(std::string msg) {
        return {RecoveryFailureType::DuplicateIndex, std::move(msg)};
    }
    static RecoveryFailure InsufficientShares(std::string msg) {
        return {RecoveryFailureType::InsufficientShares, std::move(msg)};
    }
    static RecoveryFailure UnrecognizedFormat(std::string msg) {
        return {RecoveryFailureType::UnrecognizedFormat, std::move(msg)};
    }
    static RecoveryFailure PasswordRequired(std::string msg) {
        return {RecoveryFailureType::PasswordRequired, std::move(msg)};
    }
    static RecoveryFailure WrongPassword(std::string msg) {
        return {RecoveryFailureType::WrongPassword, std::move(msg)};
    }
    static RecoveryFailure Cancelled(std::string msg) {
        return {RecoveryFailureType::Cancelled, std::move(msg)};
    }
    static RecoveryFailure Encryption(std::string msg) {
        return {RecoveryFailureType::Encryption, std::move(msg)};
    }
    static RecoveryFailure Reconstruction(std::string msg) {
        return {RecoveryFailureType::Reconstruction, std::move(msg)};
    }
    static RecoveryFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
};
}
