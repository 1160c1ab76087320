#include "crypto/accumulator_set.hpp"

#include "crypto/digest_registry.hpp"

#include <set>
#include <utility>

namespace rehash {

namespace {

std::string JoinNames(const std::set<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ",";
        out += n;
    }
    return out;
}

} // namespace

Result AccumulatorSet::Create(const std::vector<std::string>& algs, AccumulatorSet& out) {
    if (algs.empty()) {
        return Result::Fail(Errc::NoAlgorithmSpecified, "no hash algorithm specified");
    }

    std::map<std::string, std::unique_ptr<IAccumulator>> accs;
    for (const auto& alg : algs) {
        auto canonical = CanonicalAlgorithm(alg);
        if (!canonical) {
            return Result::Fail(Errc::UnsupportedAlgorithm, "unsupported hash algorithm: " + alg);
        }
        if (accs.count(*canonical)) continue;

        std::unique_ptr<IAccumulator> acc;
        auto r = NewAccumulator(*canonical, acc);
        if (!r.ok) return r;
        accs.emplace(std::move(*canonical), std::move(acc));
    }

    out = AccumulatorSet{};
    out.accs_ = std::move(accs);
    return Result::Ok();
}

Result AccumulatorSet::Restore(const StateMap& states, AccumulatorSet& out) {
    return Restore(SavedSession{.computed = 0, .states = states}, {}, out);
}

Result AccumulatorSet::Restore(const SavedSession& session,
                               const std::vector<std::string>& algs,
                               AccumulatorSet& out) {
    if (session.states.empty()) {
        return Result::Fail(Errc::NoStateProvided, "no states");
    }

    std::map<std::string, std::unique_ptr<IAccumulator>> accs;
    for (const auto& [alg, blob] : session.states) {
        auto canonical = CanonicalAlgorithm(alg);
        if (!canonical) {
            return Result::Fail(Errc::UnsupportedAlgorithm, "unsupported hash algorithm: " + alg);
        }
        if (accs.count(*canonical)) {
            return Result::Fail(Errc::AlgorithmSetMismatch, "duplicate state for " + *canonical);
        }

        std::unique_ptr<IAccumulator> acc;
        auto r = NewAccumulator(*canonical, acc);
        if (!r.ok) return r;
        r = acc->ImportState(blob);
        if (!r.ok) return r;
        accs.emplace(std::move(*canonical), std::move(acc));
    }

    if (!algs.empty()) {
        std::set<std::string> wanted;
        for (const auto& alg : algs) {
            auto canonical = CanonicalAlgorithm(alg);
            if (!canonical) {
                return Result::Fail(Errc::UnsupportedAlgorithm, "unsupported hash algorithm: " + alg);
            }
            wanted.insert(std::move(*canonical));
        }
        std::set<std::string> have;
        for (const auto& [alg, acc] : accs) {
            have.insert(alg);
        }
        if (wanted != have) {
            return Result::Fail(Errc::AlgorithmSetMismatch,
                                "algorithms [" + JoinNames(wanted) + "] do not match saved states [" +
                                    JoinNames(have) + "]");
        }
    }

    out = AccumulatorSet{};
    out.accs_ = std::move(accs);
    out.base_ = session.computed;
    return Result::Ok();
}

Result AccumulatorSet::FromAccumulators(std::vector<std::unique_ptr<IAccumulator>> accs,
                                        AccumulatorSet& out) {
    if (accs.empty()) {
        return Result::Fail(Errc::NoAlgorithmSpecified, "no hash algorithm specified");
    }

    std::map<std::string, std::unique_ptr<IAccumulator>> m;
    for (auto& acc : accs) {
        if (!acc) {
            return Result::Fail(Errc::NoAlgorithmSpecified, "null accumulator");
        }
        std::string name(acc->Algorithm());
        if (m.count(name)) {
            return Result::Fail(Errc::AlgorithmSetMismatch, "duplicate accumulator for " + name);
        }
        m.emplace(std::move(name), std::move(acc));
    }

    out = AccumulatorSet{};
    out.accs_ = std::move(m);
    return Result::Ok();
}

Result AccumulatorSet::Write(std::span<const std::uint8_t> chunk) {
    if (sealed_) {
        return Result::Fail(Errc::ConsumerProtocolViolation, "write into a terminated accumulator set");
    }
    if (accs_.empty()) {
        return Result::Fail(Errc::ConsumerProtocolViolation, "write into an empty accumulator set");
    }
    for (auto& [alg, acc] : accs_) {
        acc->Write(chunk);
    }
    written_ += chunk.size();
    return Result::Ok();
}

DigestMap AccumulatorSet::Digests() const {
    DigestMap out;
    for (const auto& [alg, acc] : accs_) {
        out.emplace(alg, acc->Sum());
    }
    return out;
}

Result AccumulatorSet::ExportState(StateMap& out) const {
    StateMap states;
    for (const auto& [alg, acc] : accs_) {
        if (!acc->SupportsSnapshot()) {
            return Result::Fail(Errc::StateExportUnsupported, alg + ": state export unsupported");
        }
        Bytes blob;
        auto r = acc->ExportState(blob);
        if (!r.ok) return r;
        states.emplace(alg, std::move(blob));
    }
    out = std::move(states);
    return Result::Ok();
}

std::vector<std::string> AccumulatorSet::Algorithms() const {
    std::vector<std::string> out;
    out.reserve(accs_.size());
    for (const auto& [alg, acc] : accs_) {
        out.push_back(alg);
    }
    return out;
}

} // namespace rehash
