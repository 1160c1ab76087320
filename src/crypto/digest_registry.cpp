#include "crypto/digest_registry.hpp"

#include "crypto/accumulators.hpp"

#include <array>
#include <cctype>

namespace rehash {

namespace {

struct Entry {
    std::string_view name;
    std::unique_ptr<IAccumulator> (*make)();
};

// Kept in lexical order.
constexpr std::array<Entry, 5> kAlgorithms{{
    {"CRC-32", &NewCrc32Accumulator},
    {"MD5", &NewMd5Accumulator},
    {"SHA-1", &NewSha1Accumulator},
    {"SHA-256", &NewSha256Accumulator},
    {"SHA-512", &NewSha512Accumulator},
}};

const Entry* Find(std::string_view name) {
    std::string upper(name);
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    for (const auto& e : kAlgorithms) {
        if (e.name == upper) return &e;
    }
    return nullptr;
}

} // namespace

std::vector<std::string> SupportedAlgorithms() {
    std::vector<std::string> out;
    out.reserve(kAlgorithms.size());
    for (const auto& e : kAlgorithms) {
        out.emplace_back(e.name);
    }
    return out;
}

std::optional<std::string> CanonicalAlgorithm(std::string_view name) {
    const Entry* e = Find(name);
    if (!e) return std::nullopt;
    return std::string(e->name);
}

bool IsSupportedAlgorithm(std::string_view name) { return Find(name) != nullptr; }

Result NewAccumulator(std::string_view name, std::unique_ptr<IAccumulator>& out) {
    const Entry* e = Find(name);
    if (!e) {
        return Result::Fail(Errc::UnsupportedAlgorithm,
                            "unsupported hash algorithm: " + std::string(name));
    }
    out = e->make();
    return Result::Ok();
}

} // namespace rehash
