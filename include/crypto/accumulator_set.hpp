#pragma once

#include "crypto/accumulator.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace rehash {

// What a caller keeps across a pause: bytes hashed so far and the exported
// accumulator states. The next source must start reading at `computed`.
struct SavedSession {
    std::uint64_t computed = 0;
    StateMap states;
};

// Accumulators for several algorithms fed in lockstep.
//
// A set restored from a snapshot starts a new lineage: BytesWritten() counts
// from zero again and BaseOffset() remembers where the snapshot was taken.
// Once sealed (a run stopped or finished) further writes are rejected.
class AccumulatorSet {
public:
    AccumulatorSet() = default;
    AccumulatorSet(const AccumulatorSet&) = delete;
    AccumulatorSet& operator=(const AccumulatorSet&) = delete;
    AccumulatorSet(AccumulatorSet&&) noexcept = default;
    AccumulatorSet& operator=(AccumulatorSet&&) noexcept = default;

    static Result Create(const std::vector<std::string>& algs, AccumulatorSet& out);

    // The keys of `states` select the algorithms.
    static Result Restore(const StateMap& states, AccumulatorSet& out);

    // `algs` may be empty. If it is not, it has to name exactly the
    // algorithms present in the session.
    static Result Restore(const SavedSession& session,
                          const std::vector<std::string>& algs,
                          AccumulatorSet& out);

    static Result FromAccumulators(std::vector<std::unique_ptr<IAccumulator>> accs,
                                   AccumulatorSet& out);

    Result Write(std::span<const std::uint8_t> chunk);

    // Only final after the stream has been consumed completely.
    DigestMap Digests() const;

    Result ExportState(StateMap& out) const;

    void Seal() { sealed_ = true; }
    bool Sealed() const { return sealed_; }

    std::uint64_t BytesWritten() const { return written_; }
    std::uint64_t BaseOffset() const { return base_; }
    std::uint64_t Offset() const { return base_ + written_; }

    std::vector<std::string> Algorithms() const;
    bool Empty() const { return accs_.empty(); }

private:
    std::map<std::string, std::unique_ptr<IAccumulator>> accs_;
    std::uint64_t written_ = 0;
    std::uint64_t base_ = 0;
    bool sealed_ = false;
};

} // namespace rehash
