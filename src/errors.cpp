#include "errors.hpp"

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::InvalidOption:
            return "invalid option";
        case ErrorKind::FileAccess:
            return "file access";
        case ErrorKind::PeerError:
            return "peer error";
        case ErrorKind::TimedOut:
            return "timed out";
        case ErrorKind::IllegalResponse:
            return "illegal response";
        case ErrorKind::Socket:
            return "socket";
        case ErrorKind::Cancelled:
            return "cancelled";
    }
    return "unknown";
}
