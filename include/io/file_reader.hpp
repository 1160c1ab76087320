#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace rehash {

// Reads a file, or standard input for "-". TotalSize() is the size of the
// whole file even when reading started at an offset.
class FileOrStdinReader final : public IReader {
public:
    static Result Open(std::string path, FileOrStdinReader &out);

    // Positions the reader at `offset`, the number of bytes already hashed.
    static Result Open(std::string path, std::uint64_t offset, FileOrStdinReader &out);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;
    void Close() override;

    const std::string &Path() const { return path_; }
    std::uint64_t StartOffset() const { return offset_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
    std::uint64_t offset_ = 0;
};

} // namespace rehash
