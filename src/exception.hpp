#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    Configuration,
    UnsupportedEnvironment,
    NotFound,
    Transport,
    Permission,
    Filesystem,
    Locked
};

const char* error_kind_name(ErrorKind kind);

class VciException : public std::runtime_error {
public:
    VciException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};
