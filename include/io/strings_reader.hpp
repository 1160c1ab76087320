#pragma once

#include "io/io.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace rehash {

// Reads one or several in-memory strings back to back.
class StringsReader final : public IReader {
  public:
    explicit StringsReader(std::string data);
    explicit StringsReader(std::vector<std::string> parts);

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return total_; }

  private:
    std::vector<std::string> parts_;
    std::size_t part_ = 0;
    std::size_t pos_ = 0;
    std::uint64_t total_ = 0;
};

} // namespace rehash
