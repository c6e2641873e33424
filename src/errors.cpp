#include "numscull/errors.hpp"

namespace Numscull {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONNECT_FAILED: return "ConnectFailed";
        case ErrorKind::CONNECTION_REFUSED: return "ConnectionRefused";
        case ErrorKind::CONNECTION_CLOSED: return "ConnectionClosed";
        case ErrorKind::READ_TIMEOUT: return "ReadTimeout";
        case ErrorKind::WRITE_FAILED: return "WriteFailed";
        case ErrorKind::TRANSPORT_CLOSED: return "TransportClosed";
        case ErrorKind::IDENTITY_NOT_FOUND: return "IdentityNotFound";
        case ErrorKind::INVALID_KEY_FORMAT: return "InvalidKeyFormat";
        case ErrorKind::AUTHENTICATION_FAILED: return "AuthenticationFailed";
        case ErrorKind::ENCRYPTION_FAILED: return "EncryptionFailed";
        case ErrorKind::HANDSHAKE_FAILED: return "HandshakeFailed";
        case ErrorKind::INVALID_HEADER: return "InvalidHeader";
        case ErrorKind::MESSAGE_TOO_LARGE: return "MessageTooLarge";
        case ErrorKind::REMOTE_ERROR: return "RemoteError";
        case ErrorKind::LOGIC_ERROR: return "LogicError";
        case ErrorKind::RUNTIME_ERROR: return "RuntimeError";
    }
    return "Unknown";
}

} // namespace Numscull
