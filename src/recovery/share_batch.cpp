#include "shardvault/recovery/share_batch.hpp"
#include <utility>

namespace shardvault::recovery {
ClassifiedInput ClassifyInput(
    const shards::FormatDetector& detector,
    shards::RawInput raw) {
    auto classification = detector.Classify(raw);
    return ClassifiedInput{
        .raw = std::move(raw),
        .classification = std::move(classification),
        .rejection = std::nullopt,
        .decrypted = false
    };
}
}
