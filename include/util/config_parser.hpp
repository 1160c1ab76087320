#pragma once
#include "util/logger.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rehash::config {

class RehashConfigFromFile {
public:
    std::vector<std::string> algorithms;

    std::optional<std::int64_t> buffer_size;
    std::optional<std::uint64_t> progress_interval_ms;
    std::optional<bool> progress;
    std::optional<LogLevel> log_level;

    // On failure `err` says why; the fields are left reset.
    bool LoadFile(const std::string &path, std::string &err);

    void Reset();

    // Algorithms for this run: the command line wins over the file. A resumed
    // run never takes them from the file, so an empty result there means
    // "whatever the saved states hold".
    std::vector<std::string> SelectAlgorithms(const std::vector<std::string> &from_cli, bool resuming) const;
};

} // namespace rehash::config
