#pragma once

#include <stdexcept>

namespace ipt {

// Rejected user input. Surfaced to callers as an invalid_target result.
class InvalidTargetError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Name resolution / connect fault inside one attempt. Never aborts a request.
class ProbeTransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The client could not talk to the test server at all.
class ServiceUnreachableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed client configuration source.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed wire payload (request or response body).
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace ipt
