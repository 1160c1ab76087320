#include "util/config_json_utils.hpp"

#include "crypto/digest_registry.hpp"

#include <fstream>

namespace rehash::config::detail {

namespace {

// The Get*IfPresent helpers return false when the key is absent; a present
// key of the wrong type sets `err`.

bool GetI64IfPresent(const nlohmann::json& j, const char* key, std::int64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_number_integer()) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    out = it->get<std::int64_t>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_number_unsigned()) {
        err = std::string(key) + " must be a non-negative integer";
        return false;
    }
    out = it->get<std::uint64_t>();
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, RehashConfigFromFile& cfg, std::string& err) {
    err.clear();

    if (auto it = j.find("Algorithms"); it != j.end()) {
        if (!it->is_array()) {
            err = "Algorithms must be an array";
            return false;
        }
        for (const auto& v : *it) {
            if (!v.is_string()) {
                err = "Algorithms must contain strings";
                return false;
            }
            auto alg = CanonicalAlgorithm(v.get<std::string>());
            if (!alg) {
                err = "unsupported hash algorithm: " + v.get<std::string>();
                return false;
            }
            cfg.algorithms.push_back(std::move(*alg));
        }
    }

    {
        std::int64_t v{};
        if (GetI64IfPresent(j, "BufferSize", v, err)) {
            cfg.buffer_size = v;
        } else if (!err.empty()) {
            return false;
        }
    }
    {
        std::uint64_t v{};
        if (GetU64IfPresent(j, "ProgressIntervalMs", v, err)) {
            cfg.progress_interval_ms = v;
        } else if (!err.empty()) {
            return false;
        }
    }
    {
        bool b{};
        if (GetBoolIfPresent(j, "Progress", b, err)) {
            cfg.progress = b;
        } else if (!err.empty()) {
            return false;
        }
    }

    if (auto it = j.find("LogLevel"); it != j.end()) {
        std::optional<LogLevel> lvl;
        if (it->is_string()) {
            lvl = ParseLogLevel(it->get<std::string>());
        }
        if (!lvl) {
            err = "LogLevel must be one of debug, info, warn, error, none";
            return false;
        }
        cfg.log_level = *lvl;
    }

    return true;
}

} // namespace rehash::config::detail
