#pragma once

/**
 * TransferError.hpp
 *
 * Error kinds raised by a transfer and the failure record kept for callers.
 */

#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ftpget::core::transfer {

/**
 * Error kind
 */
enum class ErrorKind {
    Configuration,  // Invalid request from the caller, e.g. start() twice
    Preflight,      // Destination path rejected before any I/O
    Transfer        // Connect, login, stream or file I/O failure
};

constexpr std::string_view toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "ConfigurationError";
        case ErrorKind::Preflight:     return "PreflightError";
        case ErrorKind::Transfer:      return "TransferError";
    }
    return "UnknownError";
}

inline std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
    return os << toString(kind);
}

/**
 * Base class of all exceptions thrown by transfers and their collaborators
 */
class TransferException : public std::runtime_error {
public:
    TransferException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

/**
 * Thrown synchronously to the caller; the transfer is left untouched.
 */
class ConfigurationError : public TransferException {
public:
    explicit ConfigurationError(const std::string& message)
        : TransferException(ErrorKind::Configuration, message) {}
};

class PreflightError : public TransferException {
public:
    explicit PreflightError(const std::string& message)
        : TransferException(ErrorKind::Preflight, message) {}
};

class TransferError : public TransferException {
public:
    explicit TransferError(const std::string& message)
        : TransferException(ErrorKind::Transfer, message) {}
};

/**
 * Why a transfer ended in Failed
 */
struct FailureCause {
    ErrorKind kind{ErrorKind::Transfer};
    std::string message;

    bool operator==(const FailureCause& other) const {
        return kind == other.kind && message == other.message;
    }
    bool operator!=(const FailureCause& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const FailureCause& cause) {
    return os << cause.kind << ": " << cause.message;
}

} // namespace ftpget::core::transfer
