#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <sys/types.h>

namespace rehash {

// Read() returns the number of bytes stored (> 0), 0 at end of stream and a
// negative value on error. A zero-length read is only ever end of stream.
class IReader {
public:
    virtual ~IReader() = default;
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }
    virtual void Close() {}
};

} // namespace rehash
