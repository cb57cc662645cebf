#include "exception.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::UnsupportedEnvironment: return "unsupported-environment";
        case ErrorKind::NotFound: return "not-found";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Permission: return "permission";
        case ErrorKind::Filesystem: return "filesystem";
        case ErrorKind::Locked: return "locked";
    }
    return "unknown";
}
