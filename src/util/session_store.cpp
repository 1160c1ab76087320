#include "util/session_store.hpp"

#include "crypto/digest_registry.hpp"
#include "util/hex.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace rehash {

using json = nlohmann::json;

std::expected<SavedSession, std::string> ParseSession(const std::string& json_input) {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        auto computed = j.find("computed");
        if (computed == j.end() || !computed->is_number_unsigned()) {
            return std::unexpected("'computed' must be a non-negative integer");
        }

        auto states = j.find("states");
        if (states == j.end() || !states->is_object()) {
            return std::unexpected("'states' must be an object");
        }

        SavedSession s;
        s.computed = computed->get<std::uint64_t>();
        for (const auto& [key, val] : states->items()) {
            auto alg = CanonicalAlgorithm(key);
            if (!alg) {
                return std::unexpected("unsupported hash algorithm in states: " + key);
            }
            if (!val.is_string()) {
                return std::unexpected("state for " + key + " must be a hex string");
            }
            Bytes blob;
            if (!HexDecode(val.get<std::string>(), blob)) {
                return std::unexpected("state for " + key + " is not valid hex");
            }
            if (!s.states.emplace(std::move(*alg), std::move(blob)).second) {
                return std::unexpected("duplicate state for " + key);
            }
        }
        if (s.states.empty()) {
            return std::unexpected("'states' is empty");
        }

        return s;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

std::string SerializeSession(const SavedSession& session) {
    json states = json::object();
    for (const auto& [alg, blob] : session.states) {
        states[alg] = HexEncode(blob);
    }
    json j = {
        {"computed", session.computed},
        {"states", std::move(states)},
    };
    return j.dump(2);
}

Result SaveSession(const std::string& path, const SavedSession& session) {
    const std::string tmp_path = path + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good()) {
        return Result::Fail(Errc::SessionIoError, "cannot open " + tmp_path);
    }
    os << SerializeSession(session) << "\n";
    os.close();
    if (!os.good()) {
        return Result::Fail(Errc::SessionIoError, "cannot write " + tmp_path);
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        const int e = errno;
        (void)std::remove(tmp_path.c_str());
        return Result::Fail(Errc::SessionIoError,
                            "cannot rename " + tmp_path + " (" + std::strerror(e) + ")");
    }
    return Result::Ok();
}

Result LoadSession(const std::string& path, SavedSession& out) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(Errc::SessionIoError, "cannot open session: " + path);
    }
    std::stringstream ss;
    ss << is.rdbuf();

    auto parsed = ParseSession(ss.str());
    if (!parsed) {
        return Result::Fail(Errc::SessionIoError, path + ": " + parsed.error());
    }
    out = std::move(*parsed);
    return Result::Ok();
}

} // namespace rehash
