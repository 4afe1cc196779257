#pragma once

#include <stdexcept>
#include <string>

namespace sgw::domain {

enum class ErrorKind {
    UpstreamUnreachable,
    UpstreamTimeout,
    UpstreamHttpError,
    NormalizationError,
    NotFound,
    ValidationError,
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UpstreamUnreachable: return "UpstreamUnreachable";
        case ErrorKind::UpstreamTimeout:     return "UpstreamTimeout";
        case ErrorKind::UpstreamHttpError:   return "UpstreamHTTPError";
        case ErrorKind::NormalizationError:  return "NormalizationError";
        case ErrorKind::NotFound:            return "NotFoundError";
        case ErrorKind::ValidationError:     return "ValidationError";
    }
    return "Unknown";
}

// Base of every failure a lookup can end in. Caught once, at the HTTP boundary.
class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class UpstreamUnreachable : public GatewayError {
public:
    explicit UpstreamUnreachable(const std::string& message)
        : GatewayError(ErrorKind::UpstreamUnreachable, message) {}
};

class UpstreamTimeout : public GatewayError {
public:
    explicit UpstreamTimeout(const std::string& message)
        : GatewayError(ErrorKind::UpstreamTimeout, message) {}
};

class UpstreamHttpError : public GatewayError {
public:
    UpstreamHttpError(int status, const std::string& message)
        : GatewayError(ErrorKind::UpstreamHttpError, message), status_(status) {}

    int status() const noexcept { return status_; }

private:
    int status_;
};

class NormalizationError : public GatewayError {
public:
    explicit NormalizationError(const std::string& message)
        : GatewayError(ErrorKind::NormalizationError, message) {}
};

// Upstream answered 2xx but the body is not JSON.
class MalformedUpstreamBody : public NormalizationError {
public:
    using NormalizationError::NormalizationError;
};

class NotFoundError : public GatewayError {
public:
    explicit NotFoundError(std::string batch_id)
        : GatewayError(ErrorKind::NotFound, "stamp not found for batch_id=" + batch_id)
        , batch_id_(std::move(batch_id)) {}

    const std::string& batch_id() const noexcept { return batch_id_; }

private:
    std::string batch_id_;
};

class ValidationError : public GatewayError {
public:
    explicit ValidationError(const std::string& message)
        : GatewayError(ErrorKind::ValidationError, message) {}
};

} // namespace sgw::domain
