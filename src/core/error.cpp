#include <sbus/error.h>
#include <unordered_map>

namespace sbus {
namespace v1 {

std::string SBusErrorCategory::message(int ev) const {
    SBusError error = static_cast<SBusError>(ev);

    static const std::unordered_map<SBusError, std::string> error_messages = {
        {SBusError::SUCCESS, "Success"},

        // General
        {SBusError::INVALID_PARAMETER, "Invalid parameter provided"},
        {SBusError::OUT_OF_MEMORY, "Memory allocation failed"},
        {SBusError::TIMEOUT, "Operation timed out"},
        {SBusError::NOT_INITIALIZED, "Component not initialized"},
        {SBusError::ALREADY_INITIALIZED, "Component already initialized"},
        {SBusError::OPERATION_NOT_SUPPORTED, "Operation not supported"},
        {SBusError::INTERNAL_ERROR, "Internal implementation error"},
        {SBusError::INVALID_CONFIGURATION, "Invalid configuration"},

        // Protocol
        {SBusError::MALFORMED_FIELD, "Malformed field"},
        {SBusError::DUPLICATE_FIELD, "Duplicate field"},
        {SBusError::UNKNOWN_FIELD, "Unknown field"},
        {SBusError::MISSING_FIELD, "Required field missing"},
        {SBusError::INVALID_HEX, "Invalid hex field"},
        {SBusError::INVALID_INTEGER, "Invalid integer field"},
        {SBusError::UNKNOWN_MESSAGE_TAG, "Unknown message tag"},
        {SBusError::PROTOCOL_VERSION_NOT_SUPPORTED, "Protocol version not supported"},
        {SBusError::INVALID_MESSAGE_FORMAT, "Invalid message format"},
        {SBusError::MESSAGE_TOO_LARGE, "Message exceeds maximum size"},
        {SBusError::EMPTY_PAYLOAD, "Payload is empty"},
        {SBusError::COMPRESSION_DETECTED, "Compressed payload rejected"},
        {SBusError::EMPTY_PLAINTEXT, "Decrypted plaintext is empty"},
        {SBusError::HANDSHAKE_FAILURE, "Handshake negotiation failed"},

        // Auth
        {SBusError::INVALID_TOKEN, "Invalid token"},
        {SBusError::TOKEN_EXPIRED, "Token has expired"},
        {SBusError::TOKEN_REVOKED, "Token has been revoked"},
        {SBusError::UNAUTHORIZED_COMPONENT, "Component not authorized"},
        {SBusError::TAMPERED_PAYLOAD, "Payload HMAC verification failed"},
        {SBusError::SIGNATURE_MISMATCH, "Signature mismatch"},
        {SBusError::VERIFICATION_FAILED, "Verification failed"},
        {SBusError::AUTHENTICATION_FAILED, "Authentication failed"},

        // Replay
        {SBusError::REPLAY_OR_OUT_OF_ORDER, "Sequence number replayed or out of order"},
        {SBusError::DUPLICATE_NONCE, "Duplicate nonce"},
        {SBusError::REPLAY_WINDOW_HIT, "Replay window hit"},
        {SBusError::KEY_MATERIAL_REUSED, "Key material reused for the same randoms"},

        // Abuse
        {SBusError::RATE_LIMITED, "Rate limit exceeded"},
        {SBusError::CIRCUIT_OPEN, "Circuit breaker open"},
        {SBusError::CRITICAL_ACTION_COOLDOWN, "Critical action cooldown active"},
        {SBusError::BLACKLISTED, "Source is blacklisted"},

        // State
        {SBusError::INVALID_STATE, "Invalid state for operation"},
        {SBusError::SESSION_NOT_ESTABLISHED, "Session not established"},
        {SBusError::HANDSHAKE_TIMEOUT, "Handshake deadline exceeded"},
        {SBusError::SANDBOX_INACTIVE, "Sandbox inactive"},

        // Resource
        {SBusError::EMPTY_CHAIN, "Certificate chain is empty"},
        {SBusError::EMPTY_CERTIFICATE, "Certificate entry is empty"},
        {SBusError::CERTIFICATE_EXPIRED, "Certificate has expired"},
        {SBusError::CERTIFICATE_REVOKED, "Certificate has been revoked"},
        {SBusError::CERTIFICATE_PIN_MISMATCH, "Certificate does not match pin"},
        {SBusError::PFS_KEY_EXPIRED, "Ephemeral key expired"},
        {SBusError::KEY_NOT_FOUND, "Key not found"},
        {SBusError::SESSION_NOT_FOUND, "Session not found"},
        {SBusError::TICKET_NOT_FOUND, "Ticket not found"},
        {SBusError::SANDBOX_NOT_FOUND, "Sandbox not found"},
        {SBusError::QUOTA_EXCEEDED, "Resource quota exceeded"},
        {SBusError::RESOURCE_EXHAUSTED, "Resource exhausted"},

        // Crypto
        {SBusError::DECRYPT_ERROR, "Decryption failed"},
        {SBusError::ENCRYPT_ERROR, "Encryption failed"},
        {SBusError::KEY_DERIVATION_FAILED, "Key derivation failed"},
        {SBusError::CRYPTO_PROVIDER_ERROR, "Cryptographic provider error"},
        {SBusError::RANDOM_GENERATION_FAILED, "Random number generation failed"},
        {SBusError::KEY_EXCHANGE_FAILED, "Key exchange failed"},

        // Transport
        {SBusError::DESTINATION_NOT_FOUND, "Destination not registered"},
        {SBusError::CHANNEL_SEND_FAILED, "Channel send failed"},
        {SBusError::QUEUE_FULL, "Queue full"},
        {SBusError::QUEUE_EMPTY, "Queue empty"},
        {SBusError::UNKNOWN_COMMAND, "Unknown command"}
    };

    auto it = error_messages.find(error);
    if (it != error_messages.end()) {
        return it->second;
    }

    return "Unknown secure bus error (" + std::to_string(ev) + ")";
}

bool SBusErrorCategory::equivalent(const std::error_code& code, int condition) const noexcept {
    return (code.category() == *this) && (code.value() == condition);
}

std::string error_message(SBusError error) {
    return SBusErrorCategory::instance().message(static_cast<int>(error));
}

ErrorClass error_class(SBusError error) {
    int value = static_cast<int>(error);
    if (value == 0) return ErrorClass::NONE;
    if (value < 20) return ErrorClass::GENERAL;
    if (value < 40) return ErrorClass::PROTOCOL;
    if (value < 60) return ErrorClass::AUTH;
    if (value < 70) return ErrorClass::REPLAY;
    if (value < 80) return ErrorClass::ABUSE;
    if (value < 90) return ErrorClass::STATE;
    if (value < 110) return ErrorClass::RESOURCE;
    if (value < 130) return ErrorClass::CRYPTO;
    if (value < 150) return ErrorClass::TRANSPORT;
    return ErrorClass::GENERAL;
}

const char* error_class_name(ErrorClass cls) {
    switch (cls) {
        case ErrorClass::NONE: return "none";
        case ErrorClass::GENERAL: return "general";
        case ErrorClass::PROTOCOL: return "protocol";
        case ErrorClass::AUTH: return "auth";
        case ErrorClass::REPLAY: return "replay";
        case ErrorClass::ABUSE: return "abuse";
        case ErrorClass::STATE: return "state";
        case ErrorClass::RESOURCE: return "resource";
        case ErrorClass::CRYPTO: return "crypto";
        case ErrorClass::TRANSPORT: return "transport";
    }
    return "unknown";
}

bool is_fatal_error(SBusError error) {
    switch (error) {
        // Recoverable by retrying later or with fresh input
        case SBusError::SUCCESS:
        case SBusError::TIMEOUT:
        case SBusError::RATE_LIMITED:
        case SBusError::CIRCUIT_OPEN:
        case SBusError::CRITICAL_ACTION_COOLDOWN:
        case SBusError::REPLAY_OR_OUT_OF_ORDER:
        case SBusError::DUPLICATE_NONCE:
        case SBusError::REPLAY_WINDOW_HIT:
        case SBusError::CHANNEL_SEND_FAILED:
        case SBusError::QUEUE_FULL:
        case SBusError::QUEUE_EMPTY:
        case SBusError::SESSION_NOT_FOUND:
        case SBusError::TICKET_NOT_FOUND:
            return false;

        default:
            return true;
    }
}

bool is_retryable_error(SBusError error) {
    switch (error) {
        case SBusError::TIMEOUT:
        case SBusError::RATE_LIMITED:
        case SBusError::CIRCUIT_OPEN:
        case SBusError::CRITICAL_ACTION_COOLDOWN:
        case SBusError::CHANNEL_SEND_FAILED:
        case SBusError::QUEUE_FULL:
            return true;

        default:
            return false;
    }
}

} // namespace v1
} // namespace sbus
