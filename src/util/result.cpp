#include "util/result.hpp"

namespace ingest {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:            return "none";
        case ErrorKind::TransientIo:     return "transient-io";
        case ErrorKind::TransientUpload: return "transient-upload";
        case ErrorKind::Integrity:       return "integrity";
        case ErrorKind::Archive:         return "archive";
        case ErrorKind::Backend:         return "backend";
        case ErrorKind::Config:          return "config";
        case ErrorKind::Io:              return "io";
        case ErrorKind::Exhausted:       return "exhausted";
        case ErrorKind::Cancelled:       return "cancelled";
    }
    return "unknown";
}

} // namespace ingest
