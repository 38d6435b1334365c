#include "transport.hpp"

namespace supercast {

const char* toString(FailureKind kind) {
    switch (kind) {
        case FailureKind::Timeout:          return "timeout";
        case FailureKind::ConnectionFailed: return "connection_failed";
        case FailureKind::TlsFailure:       return "tls_failure";
        case FailureKind::HttpStatus:       return "http_status";
        case FailureKind::DecodeFailure:    return "decode_failure";
        case FailureKind::Other:            return "other";
    }
    return "other";
}

} // namespace supercast
