#include "pagebridge/util/result.hpp"

namespace pagebridge {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:       return "none";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Transport:  return "transport";
        case ErrorKind::Auth:       return "auth";
        case ErrorKind::Remote:     return "remote";
        case ErrorKind::Timeout:    return "timeout";
    }
    return "unknown";
}

} // namespace pagebridge
