#pragma once

#include <stdexcept>
#include <string>

namespace rerank_bench {

// Connection, DNS or timeout failure reported by the transport.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The service answered with status >= 400.
class HttpStatusError : public std::runtime_error {
public:
    HttpStatusError(long status, std::string body, const std::string& what)
        : std::runtime_error(what), status_(status), body_(std::move(body)) {}

    long Status() const noexcept { return status_; }
    const std::string& Body() const noexcept { return body_; }

private:
    long status_;
    std::string body_;
};

// Malformed or misaligned response payload.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Benchmark-level result checks (empty rerank, score count mismatch).
class ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A client handle could not be constructed. Fatal to the acquiring caller.
class ClientCreationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}
