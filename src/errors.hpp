#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace sift {

// Base for every error that crosses a component boundary. type() is the
// stable name written into JSON error bodies and SSE error frames.
class Error : public std::runtime_error {
public:
    Error(std::string type, const std::string& message)
        : std::runtime_error(message), type_(std::move(type)) {}

    const std::string& type() const { return type_; }

private:
    std::string type_;
};

// No content submitted, or a malformed request. Raised before any state
// is mutated.
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message,
                             std::string type = "ValidationError")
        : Error(std::move(type), message) {}
};

// A session could not be created or a stream could not be opened.
class GatewayError : public Error {
public:
    explicit GatewayError(const std::string& message,
                          std::string type = "GatewayError")
        : Error(std::move(type), message) {}
};

// Stream-level failure. Terminal for the stream that produced it.
class TransportError : public Error {
public:
    explicit TransportError(const std::string& message)
        : Error("TransportError", message) {}
};

// Structured error sent by the producer as stream data.
class ApplicationError : public Error {
public:
    explicit ApplicationError(const std::string& message)
        : Error("ApplicationError", message) {}
};

// Malformed frame payload. Logged and swallowed by consumers.
class ParseError : public Error {
public:
    explicit ParseError(const std::string& message)
        : Error("ParseError", message) {}
};

} // namespace sift
