#include "engine/checksums.hpp"

#include "util/hex.hpp"

#include <type_traits>
#include <utility>
#include <variant>

namespace rehash {

std::map<std::string, std::string> ChecksumStrings(const DigestMap& digests) {
    std::map<std::string, std::string> out;
    for (const auto& [alg, digest] : digests) {
        out.emplace(alg, HexEncode(digest));
    }
    return out;
}

std::optional<std::string> Match(const DigestMap& digests, std::string_view checksum) {
    const std::string wanted = NormalizeHex(std::string(checksum));
    for (const auto& [alg, digest] : digests) {
        if (HexEncode(digest) == wanted) return alg;
    }
    return std::nullopt;
}

Result Compute(std::unique_ptr<IReader> source,
               AccumulatorSet set,
               const EngineOptions& opt,
               CancelToken cancel,
               ComputeOutcome& out) {
    EventStream stream;
    auto r = HashEngine::Start(std::move(source), std::move(set), opt, std::move(cancel), stream);
    if (!r.ok) return r;

    out = ComputeOutcome{};
    Result result = Result::Ok();
    while (auto ev = stream.Next()) {
        std::visit(
            [&](auto& e) {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, OkEvent>) {
                    out.completed = true;
                    out.processed = e.processed;
                    out.offset = e.offset;
                    out.digests = std::move(e.digests);
                } else if constexpr (std::is_same_v<T, StopEvent>) {
                    out.processed = e.processed;
                    out.offset = e.offset;
                    out.reason = e.reason;
                    out.session = e.Session();
                } else if constexpr (std::is_same_v<T, ErrorEvent>) {
                    result = std::move(e.error);
                }
            },
            *ev);
    }
    return result;
}

} // namespace rehash
