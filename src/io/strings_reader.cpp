#include "io/strings_reader.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

namespace rehash {

StringsReader::StringsReader(std::string data) {
    parts_.push_back(std::move(data));
    total_ = parts_.front().size();
}

StringsReader::StringsReader(std::vector<std::string> parts) : parts_(std::move(parts)) {
    for (const auto& p : parts_) {
        total_ += p.size();
    }
}

ssize_t StringsReader::Read(std::span<std::uint8_t> out) {
    size_t copied = 0;
    while (copied < out.size() && part_ < parts_.size()) {
        const std::string& cur = parts_[part_];
        if (pos_ >= cur.size()) {
            ++part_;
            pos_ = 0;
            continue;
        }
        const size_t n = std::min(out.size() - copied, cur.size() - pos_);
        std::memcpy(out.data() + copied, cur.data() + pos_, n);
        pos_ += n;
        copied += n;
    }
    return static_cast<ssize_t>(copied);
}

} // namespace rehash
