#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace rehash::config {

void RehashConfigFromFile::Reset() {
    algorithms.clear();
    buffer_size.reset();
    progress_interval_ms.reset();
    progress.reset();
    log_level.reset();
}

bool RehashConfigFromFile::LoadFile(const std::string& path, std::string& err) {
    Reset();

    nlohmann::json json;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return false;
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        err += " in " + path;
        Reset();
        return false;
    }

    return true;
}

std::vector<std::string> RehashConfigFromFile::SelectAlgorithms(const std::vector<std::string> &from_cli,
                                                                bool resuming) const {
    if (!from_cli.empty() || resuming) {
        return from_cli;
    }
    return algorithms;
}

} // namespace rehash::config
