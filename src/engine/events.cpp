#include "engine/events.hpp"

namespace rehash {

float Percent(std::uint64_t done, std::uint64_t total) {
    if (total == 0) return 0.0f;
    const double pct = 100.0 * static_cast<double>(done) / static_cast<double>(total);
    return static_cast<float>(pct > 100.0 ? 100.0 : pct);
}

} // namespace rehash
