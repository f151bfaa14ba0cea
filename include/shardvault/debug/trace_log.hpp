#pragma once

/**
 * @file trace_log.hpp
 * @brief Debug tracing for shard classification, decryption passes and verdicts.
 *
 * Traces go to stdout and carry only source descriptors, counts, indices and
 * verdict kinds. Passwords, payload bytes, tokens and the secret are never
 * passed to these helpers.
 *
 * Enable via CMake: -DSHARDVAULT_DEBUG_TRACE=ON
 */

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace shardvault::debug {

// ============================================================================
// Stage identifiers - always defined so types are available
// ============================================================================

enum class Stage {
    Generation,
    Classification,
    Validation,
    Decryption,
    Reconstruction
};

#ifdef SHARDVAULT_DEBUG_TRACE

inline const char* StageToString(Stage stage) {
    switch (stage) {
        case Stage::Generation: return "GENERATE";
        case Stage::Classification: return "CLASSIFY";
        case Stage::Validation: return "VALIDATE";
        case Stage::Decryption: return "DECRYPT";
        case Stage::Reconstruction: return "COMBINE";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Core logging macros
// ============================================================================

#define SV_TRACE_VALUE(stage, name, value) \
    do { \
        fprintf(stdout, "[SV-TRACE] %s %s: %s\n", \
            ::shardvault::debug::StageToString(stage), \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define SV_TRACE_MSG(stage, message) \
    do { \
        fprintf(stdout, "[SV-TRACE] %s %s\n", \
            ::shardvault::debug::StageToString(stage), \
            message); \
        fflush(stdout); \
    } while(0)

#define SV_TRACE_SECTION(stage, section_name) \
    do { \
        fprintf(stdout, "[SV-TRACE] %s ========== %s ==========\n", \
            ::shardvault::debug::StageToString(stage), \
            section_name); \
        fflush(stdout); \
    } while(0)

// ============================================================================
// Typed helpers
// ============================================================================

inline void LogGeneration(uint32_t total, uint32_t threshold, bool encrypted) {
    SV_TRACE_SECTION(Stage::Generation, "SPLIT");
    SV_TRACE_VALUE(Stage::Generation, "total", total);
    SV_TRACE_VALUE(Stage::Generation, "threshold", threshold);
    SV_TRACE_MSG(Stage::Generation, encrypted ? "encrypted export requested" : "plaintext export only");
}

inline void LogClassification(std::string_view source, std::string_view kind) {
    const std::string line = std::string(source) + " -> " + std::string(kind);
    SV_TRACE_MSG(Stage::Classification, line.c_str());
}

inline void LogVerdict(std::string_view kind, size_t usable, uint32_t threshold) {
    const std::string line = std::string(kind) + " (usable " + std::to_string(usable) +
        ", threshold " + std::to_string(threshold) + ")";
    SV_TRACE_MSG(Stage::Validation, line.c_str());
}

inline void LogDecryptionPass(
    uint32_t attempt,
    size_t pending,
    size_t decrypted,
    size_t invalid) {

    SV_TRACE_SECTION(Stage::Decryption, "PASS");
    SV_TRACE_VALUE(Stage::Decryption, "attempt", attempt);
    SV_TRACE_VALUE(Stage::Decryption, "pending", pending);
    SV_TRACE_VALUE(Stage::Decryption, "decrypted", decrypted);
    SV_TRACE_VALUE(Stage::Decryption, "invalid", invalid);
}

inline void LogCombine(size_t used, uint32_t threshold) {
    SV_TRACE_VALUE(Stage::Reconstruction, "shards_used", used);
    SV_TRACE_VALUE(Stage::Reconstruction, "threshold", threshold);
}

#else // !SHARDVAULT_DEBUG_TRACE

// No-op implementations when SHARDVAULT_DEBUG_TRACE is not defined
#define SV_TRACE_VALUE(stage, name, value) ((void)0)
#define SV_TRACE_MSG(stage, message) ((void)0)
#define SV_TRACE_SECTION(stage, section_name) ((void)0)

inline void LogGeneration(uint32_t, uint32_t, bool) {}
inline void LogClassification(std::string_view, std::string_view) {}
inline void LogVerdict(std::string_view, size_t, uint32_t) {}
inline void LogDecryptionPass(uint32_t, size_t, size_t, size_t) {}
inline void LogCombine(size_t, uint32_t) {}

#endif // SHARDVAULT_DEBUG_TRACE

} // namespace shardvault::debug
