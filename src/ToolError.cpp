#include "ToolError.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::SizeExceeded: return "SizeExceeded";
        case ErrorKind::DecodeError: return "DecodeError";
        case ErrorKind::Internal: return "Internal";
    }
    return "Internal";
}

int error_kind_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument: return 400;
        case ErrorKind::NotFound: return 404;
        case ErrorKind::SizeExceeded: return 413;
        case ErrorKind::DecodeError: return 422;
        case ErrorKind::Internal: return 500;
    }
    return 500;
}

ToolError::ToolError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message.empty() ? std::string("Tool error") : message),
      kind_(kind) {}
