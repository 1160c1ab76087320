#include "util/result.hpp"

namespace rehash {

const char* ToString(Errc e) {
    switch (e) {
        case Errc::None:                      return "ok";
        case Errc::UnsupportedAlgorithm:      return "unsupported hash algorithm";
        case Errc::NoAlgorithmSpecified:      return "no hash algorithm specified";
        case Errc::NoStateProvided:           return "no states";
        case Errc::AlgorithmSetMismatch:      return "algorithms do not match saved states";
        case Errc::StateImportFailed:         return "state import failed";
        case Errc::StateExportUnsupported:    return "state export unsupported";
        case Errc::SourceReadError:           return "source read error";
        case Errc::ConsumerProtocolViolation: return "write after termination";
        case Errc::IncorrectComputedSize:     return "incorrect computed size";
        case Errc::SourceOpenFailed:          return "source open failed";
        case Errc::SessionIoError:            return "session i/o error";
        case Errc::ConfigError:               return "config error";
        case Errc::InternalError:             return "internal error";
    }
    return "unknown error";
}

} // namespace rehash
