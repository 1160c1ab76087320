#pragma once

#include "crypto/accumulator.hpp"
#include "crypto/accumulator_set.hpp"
#include "engine/cancel_token.hpp"
#include "engine/hash_engine.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace rehash {

// Algorithm -> lower-case hex digest.
std::map<std::string, std::string> ChecksumStrings(const DigestMap& digests);

// Returns the algorithm whose digest equals `checksum` (hex, any case).
std::optional<std::string> Match(const DigestMap& digests, std::string_view checksum);

struct ComputeOutcome {
    bool completed = false;
    std::uint64_t processed = 0;
    std::uint64_t offset = 0;
    DigestMap digests;              // set when completed
    std::optional<SavedSession> session;  // set when stopped
    StopReason reason = StopReason::None;
};

// Blocks until the run ends and collects its terminal event. A stop is not
// an error: `completed` is false and `session` holds what is needed to resume.
Result Compute(std::unique_ptr<IReader> source,
               AccumulatorSet set,
               const EngineOptions& opt,
               CancelToken cancel,
               ComputeOutcome& out);

} // namespace rehash
