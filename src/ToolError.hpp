#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    InvalidArgument,
    NotFound,
    SizeExceeded,
    DecodeError,
    Internal
};

// Stable name of an error kind, e.g. "NotFound".
const char* error_kind_name(ErrorKind kind);

// HTTP-like status for an error kind (400, 404, 413, 422, 500).
int error_kind_status(ErrorKind kind);

class ToolError : public std::runtime_error {
public:
    ToolError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }
    int status() const { return error_kind_status(kind_); }

private:
    ErrorKind kind_;
};
