#pragma once
#include <string>
#include <utility>

namespace rehash {

enum class Errc : int {
    None = 0,
    UnsupportedAlgorithm,
    NoAlgorithmSpecified,
    NoStateProvided,
    AlgorithmSetMismatch,
    StateImportFailed,
    StateExportUnsupported,
    SourceReadError,
    ConsumerProtocolViolation,
    IncorrectComputedSize,
    SourceOpenFailed,
    SessionIoError,
    ConfigError,
    InternalError,
};

const char* ToString(Errc e);

struct Result {
    bool ok{true};
    Errc err{Errc::None};
    std::string msg;

    static Result Ok() { return {}; }
    static Result Fail(Errc e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
};

} // namespace rehash
