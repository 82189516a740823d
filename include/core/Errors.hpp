#pragma once

#include <stdexcept>
#include <string>

namespace dropzone {

// Startup failures. main() reports these and exits non-zero.

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class BindError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CertificateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Storage write/publish failure. Aborts one upload, never the server.
class IOError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The peer went away or the socket failed; nothing can be sent back.
class ConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Client-side request problem that maps to an HTTP status.
 */
class RequestError : public std::runtime_error {
public:
    RequestError(int status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

class MalformedRequestError : public RequestError {
public:
    explicit MalformedRequestError(const std::string& message) : RequestError(400, message) {}
};

class EncodingError : public RequestError {
public:
    explicit EncodingError(const std::string& message) : RequestError(400, message) {}
};

class LengthRequiredError : public RequestError {
public:
    explicit LengthRequiredError(const std::string& message) : RequestError(411, message) {}
};

class PayloadTooLargeError : public RequestError {
public:
    explicit PayloadTooLargeError(const std::string& message) : RequestError(413, message) {}
};

class UnsupportedMediaTypeError : public RequestError {
public:
    explicit UnsupportedMediaTypeError(const std::string& message) : RequestError(415, message) {}
};

} // namespace dropzone
