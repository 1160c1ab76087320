#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rehash {

using Bytes = std::vector<std::uint8_t>;

// Keyed by canonical algorithm name.
using StateMap = std::map<std::string, Bytes>;
using DigestMap = std::map<std::string, Bytes>;

// Incremental digest state for one algorithm.
class IAccumulator {
public:
    virtual ~IAccumulator() = default;

    virtual std::string_view Algorithm() const = 0;
    virtual std::size_t DigestSize() const = 0;

    virtual void Write(std::span<const std::uint8_t> data) = 0;

    // Digest of everything written so far. Does not change the running state.
    virtual Bytes Sum() const = 0;

    // Accumulators that cannot snapshot return false here and fail
    // ExportState/ImportState with StateExportUnsupported.
    virtual bool SupportsSnapshot() const { return true; }

    // The blob is self-contained: importing it into a fresh accumulator of
    // the same algorithm and writing the rest of the stream gives the same
    // digest as one unbroken pass.
    virtual Result ExportState(Bytes& out) const = 0;
    virtual Result ImportState(std::span<const std::uint8_t> blob) = 0;
};

} // namespace rehash
