#ifndef SBUS_ERROR_H
#define SBUS_ERROR_H

#include <sbus/config.h>
#include <system_error>
#include <string>
#include <cstdint>

namespace sbus {
namespace v1 {

// Secure bus error codes, grouped by failure class
enum class SBusError : int {
    SUCCESS = 0,

    // General errors (1-19)
    INVALID_PARAMETER = 1,
    OUT_OF_MEMORY = 2,
    TIMEOUT = 3,
    NOT_INITIALIZED = 4,
    ALREADY_INITIALIZED = 5,
    OPERATION_NOT_SUPPORTED = 6,
    INTERNAL_ERROR = 7,
    INVALID_CONFIGURATION = 8,

    // Protocol errors (20-39)
    MALFORMED_FIELD = 20,
    DUPLICATE_FIELD = 21,
    UNKNOWN_FIELD = 22,
    MISSING_FIELD = 23,
    INVALID_HEX = 24,
    INVALID_INTEGER = 25,
    UNKNOWN_MESSAGE_TAG = 26,
    PROTOCOL_VERSION_NOT_SUPPORTED = 27,
    INVALID_MESSAGE_FORMAT = 28,
    MESSAGE_TOO_LARGE = 29,
    EMPTY_PAYLOAD = 30,
    COMPRESSION_DETECTED = 31,
    EMPTY_PLAINTEXT = 32,
    HANDSHAKE_FAILURE = 33,

    // Authentication / authorization errors (40-59)
    INVALID_TOKEN = 40,
    TOKEN_EXPIRED = 41,
    TOKEN_REVOKED = 42,
    UNAUTHORIZED_COMPONENT = 43,
    TAMPERED_PAYLOAD = 44,
    SIGNATURE_MISMATCH = 45,
    VERIFICATION_FAILED = 46,
    AUTHENTICATION_FAILED = 47,

    // Replay errors (60-69)
    REPLAY_OR_OUT_OF_ORDER = 60,
    DUPLICATE_NONCE = 61,
    REPLAY_WINDOW_HIT = 62,
    KEY_MATERIAL_REUSED = 63,

    // Abuse-control errors (70-79)
    RATE_LIMITED = 70,
    CIRCUIT_OPEN = 71,
    CRITICAL_ACTION_COOLDOWN = 72,
    BLACKLISTED = 73,

    // State errors (80-89)
    INVALID_STATE = 80,
    SESSION_NOT_ESTABLISHED = 81,
    HANDSHAKE_TIMEOUT = 82,
    SANDBOX_INACTIVE = 83,

    // Resource errors (90-109)
    EMPTY_CHAIN = 90,
    EMPTY_CERTIFICATE = 91,
    CERTIFICATE_EXPIRED = 92,
    CERTIFICATE_REVOKED = 93,
    CERTIFICATE_PIN_MISMATCH = 94,
    PFS_KEY_EXPIRED = 95,
    KEY_NOT_FOUND = 96,
    SESSION_NOT_FOUND = 97,
    TICKET_NOT_FOUND = 98,
    SANDBOX_NOT_FOUND = 99,
    QUOTA_EXCEEDED = 100,
    RESOURCE_EXHAUSTED = 101,

    // Cryptographic errors (110-129)
    DECRYPT_ERROR = 110,
    ENCRYPT_ERROR = 111,
    KEY_DERIVATION_FAILED = 112,
    CRYPTO_PROVIDER_ERROR = 113,
    RANDOM_GENERATION_FAILED = 114,
    KEY_EXCHANGE_FAILED = 115,

    // Transport errors (130-149)
    DESTINATION_NOT_FOUND = 130,
    CHANNEL_SEND_FAILED = 131,
    QUEUE_FULL = 132,
    QUEUE_EMPTY = 133,
    UNKNOWN_COMMAND = 134
};

// Failure classes callers dispatch on
enum class ErrorClass : uint8_t {
    NONE,
    GENERAL,
    PROTOCOL,
    AUTH,
    REPLAY,
    ABUSE,
    STATE,
    RESOURCE,
    CRYPTO,
    TRANSPORT
};

class SBusErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "sbus";
    }

    std::string message(int ev) const override;

    bool equivalent(const std::error_code& code, int condition) const noexcept override;

    static const SBusErrorCategory& instance() {
        static SBusErrorCategory instance;
        return instance;
    }
};

inline std::error_code make_error_code(SBusError e) {
    return std::error_code(static_cast<int>(e), SBusErrorCategory::instance());
}

class SBUS_API SBusException : public std::system_error {
public:
    explicit SBusException(SBusError error)
        : std::system_error(make_error_code(error)) {}

    SBusException(SBusError error, const std::string& what_arg)
        : std::system_error(make_error_code(error), what_arg) {}

    SBusError sbus_error() const noexcept {
        return static_cast<SBusError>(code().value());
    }
};

SBUS_API std::string error_message(SBusError error);
SBUS_API ErrorClass error_class(SBusError error);
SBUS_API const char* error_class_name(ErrorClass cls);
SBUS_API bool is_fatal_error(SBusError error);
SBUS_API bool is_retryable_error(SBusError error);

#define SBUS_THROW_IF_ERROR(error) \
    do { \
        if ((error) != ::sbus::v1::SBusError::SUCCESS) { \
            throw ::sbus::v1::SBusException((error)); \
        } \
    } while (0)

} // namespace v1
} // namespace sbus

namespace std {
template<>
struct is_error_code_enum<sbus::v1::SBusError> : true_type {};
}

#endif // SBUS_ERROR_H
