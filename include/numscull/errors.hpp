#ifndef NUMSCULL_ERRORS_HPP
#define NUMSCULL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Numscull {

/**
 * @brief Every failure the engine can report, grouped by family.
 */
enum class ErrorKind {
    // Connectivity
    CONNECT_FAILED,
    CONNECTION_REFUSED,
    CONNECTION_CLOSED,
    READ_TIMEOUT,
    WRITE_FAILED,
    TRANSPORT_CLOSED,
    // Identity / configuration
    IDENTITY_NOT_FOUND,
    INVALID_KEY_FORMAT,
    // Cryptographic
    AUTHENTICATION_FAILED,
    ENCRYPTION_FAILED,
    HANDSHAKE_FAILED,
    // Framing
    INVALID_HEADER,
    MESSAGE_TOO_LARGE,
    // Server-side rejection
    REMOTE_ERROR,
    // Library misuse and everything else
    LOGIC_ERROR,
    RUNTIME_ERROR
};

const char* to_string(ErrorKind kind);

/**
 * @brief Base class for all Numscull exceptions.
 */
class Exception : public std::exception {
public:
    explicit Exception(const std::string& message) : msg_(message) {}
    explicit Exception(const char* message) : msg_(message) {}
    virtual ~Exception() noexcept override = default;

    virtual const char* what() const noexcept override {
        return msg_.c_str();
    }

    virtual ErrorKind kind() const noexcept = 0;

protected:
    std::string msg_;
};

/**
 * @brief Exception for errors that occur at runtime.
 */
class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& message) : Exception(message) {}
    explicit RuntimeError(const char* message) : Exception(message) {}

    ErrorKind kind() const noexcept override { return ErrorKind::RUNTIME_ERROR; }
};

/**
 * @brief Exception for logic errors in the library's usage.
 */
class LogicError : public Exception {
public:
    explicit LogicError(const std::string& message) : Exception(message) {}
    explicit LogicError(const char* message) : Exception(message) {}

    ErrorKind kind() const noexcept override { return ErrorKind::LOGIC_ERROR; }
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgument : public LogicError {
public:
    explicit InvalidArgument(const std::string& message) : LogicError(message) {}
    explicit InvalidArgument(const char* message) : LogicError(message) {}
};

// --- Connectivity ---
// Recoverable only through a brand-new transport and handshake.

class ConnectivityError : public RuntimeError {
public:
    using RuntimeError::RuntimeError;
};

class ConnectFailed : public ConnectivityError {
public:
    using ConnectivityError::ConnectivityError;
    ErrorKind kind() const noexcept override { return ErrorKind::CONNECT_FAILED; }
};

class ConnectionRefused : public ConnectFailed {
public:
    using ConnectFailed::ConnectFailed;
    ErrorKind kind() const noexcept override { return ErrorKind::CONNECTION_REFUSED; }
};

class ConnectionClosed : public ConnectivityError {
public:
    using ConnectivityError::ConnectivityError;
    ErrorKind kind() const noexcept override { return ErrorKind::CONNECTION_CLOSED; }
};

class ReadTimeout : public ConnectivityError {
public:
    using ConnectivityError::ConnectivityError;
    ErrorKind kind() const noexcept override { return ErrorKind::READ_TIMEOUT; }
};

class WriteFailed : public ConnectivityError {
public:
    using ConnectivityError::ConnectivityError;
    ErrorKind kind() const noexcept override { return ErrorKind::WRITE_FAILED; }
};

class TransportClosed : public ConnectivityError {
public:
    using ConnectivityError::ConnectivityError;
    ErrorKind kind() const noexcept override { return ErrorKind::TRANSPORT_CLOSED; }
};

// --- Identity / configuration ---

class IdentityError : public RuntimeError {
public:
    using RuntimeError::RuntimeError;
};

class IdentityNotFound : public IdentityError {
public:
    using IdentityError::IdentityError;
    ErrorKind kind() const noexcept override { return ErrorKind::IDENTITY_NOT_FOUND; }
};

class InvalidKeyFormat : public IdentityError {
public:
    using IdentityError::IdentityError;
    ErrorKind kind() const noexcept override { return ErrorKind::INVALID_KEY_FORMAT; }
};

// --- Cryptographic ---

class CryptoError : public RuntimeError {
public:
    using RuntimeError::RuntimeError;
};

/**
 * @brief A box failed to verify. The channel that produced it must be abandoned.
 */
class AuthenticationFailed : public CryptoError {
public:
    using CryptoError::CryptoError;
    ErrorKind kind() const noexcept override { return ErrorKind::AUTHENTICATION_FAILED; }
};

class EncryptionFailed : public CryptoError {
public:
    using CryptoError::CryptoError;
    ErrorKind kind() const noexcept override { return ErrorKind::ENCRYPTION_FAILED; }
};

class HandshakeFailed : public CryptoError {
public:
    using CryptoError::CryptoError;
    ErrorKind kind() const noexcept override { return ErrorKind::HANDSHAKE_FAILED; }
};

// --- Framing ---

class FramingError : public RuntimeError {
public:
    using RuntimeError::RuntimeError;
};

class InvalidHeader : public FramingError {
public:
    using FramingError::FramingError;
    ErrorKind kind() const noexcept override { return ErrorKind::INVALID_HEADER; }
};

class MessageTooLarge : public FramingError {
public:
    using FramingError::FramingError;
    ErrorKind kind() const noexcept override { return ErrorKind::MESSAGE_TOO_LARGE; }
};

/**
 * @brief The server answered with a control/error envelope.
 *
 * This is an expected outcome, not a systems fault, so it does not derive
 * from RuntimeError. reason() is the server's text, meant for humans.
 */
class RemoteError : public Exception {
public:
    explicit RemoteError(const std::string& reason) : Exception(reason), reason_(reason) {}

    ErrorKind kind() const noexcept override { return ErrorKind::REMOTE_ERROR; }
    const std::string& reason() const noexcept { return reason_; }

private:
    std::string reason_;
};

} // namespace Numscull

#endif // NUMSCULL_ERRORS_HPP
