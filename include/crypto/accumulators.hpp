#pragma once

#include "crypto/accumulator.hpp"

#include <memory>

namespace rehash {

// MD5, SHA-1, SHA-256 and SHA-512 run on OpenSSL's digest contexts, CRC-32
// (IEEE) on zlib. All of them export their state in the binary layout of
// Go's hash MarshalBinary, so snapshots are portable between processes and
// with Go programs.
std::unique_ptr<IAccumulator> NewMd5Accumulator();
std::unique_ptr<IAccumulator> NewSha1Accumulator();
std::unique_ptr<IAccumulator> NewSha256Accumulator();
std::unique_ptr<IAccumulator> NewSha512Accumulator();
std::unique_ptr<IAccumulator> NewCrc32Accumulator();

} // namespace rehash
