#pragma once

#include <stdexcept>
#include <string>

namespace camper {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Transport failure or unexpected HTTP status. Worth retrying.
class NetworkError : public Error {
public:
    explicit NetworkError(const std::string& message, long status = 0)
        : Error(message), http_status(status) {}

    long status() const { return http_status; }

private:
    long http_status;
};

// The catalog rejected the session credential; the user has to log in again.
class AuthExpired : public Error {
public:
    using Error::Error;
};

class ParseError : public Error {
public:
    using Error::Error;
};

// Engine command issued before the stream finished loading.
class NotReady : public Error {
public:
    using Error::Error;
};

// The track exists but the catalog offers no playable stream for it.
class StreamUnavailable : public Error {
public:
    using Error::Error;
};

enum class ErrorKind {
    Network,
    AuthExpired,
    Parse,
    NoStream,
    Timeout,
    Decode,
};

struct ErrorCause {
    ErrorKind kind = ErrorKind::Decode;
    std::string message;
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Network: return "network";
    case ErrorKind::AuthExpired: return "auth_expired";
    case ErrorKind::Parse: return "parse";
    case ErrorKind::NoStream: return "no_stream";
    case ErrorKind::Timeout: return "timeout";
    case ErrorKind::Decode: return "decode";
    }
    return "unknown";
}

} // namespace camper
