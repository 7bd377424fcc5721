#ifndef SBUS_TYPES_H
#define SBUS_TYPES_H

#include <sbus/config.h>
#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <chrono>
#include <optional>

namespace sbus {
namespace v1 {

using Bytes = std::vector<uint8_t>;
using SequenceNumber = uint64_t;
using ProtocolVersion = uint16_t;
using CipherSuiteId = uint16_t;

// Milliseconds on the monotonic timeline of a Clock
using Timestamp = std::chrono::milliseconds;

constexpr ProtocolVersion PROTOCOL_VERSION = 0x0303;

constexpr size_t RANDOM_LENGTH = 32;
constexpr size_t HMAC_TAG_LENGTH = 32;
constexpr size_t SEQUENCE_LENGTH = 8;
constexpr size_t AEAD_NONCE_LENGTH = 12;
constexpr size_t AEAD_TAG_LENGTH = 16;

// Cipher suite identifiers accepted by the handshake
enum class CipherSuite : uint16_t {
    RSA_WITH_AES_128_CBC_SHA = 0x002F,
    RSA_WITH_AES_256_CBC_SHA = 0x0035,
    RSA_WITH_AES_128_CBC_SHA256 = 0x003C,
    RSA_WITH_AES_256_CBC_SHA256 = 0x003D
};

constexpr std::array<CipherSuite, 4> SUPPORTED_CIPHER_SUITES = {
    CipherSuite::RSA_WITH_AES_128_CBC_SHA,
    CipherSuite::RSA_WITH_AES_256_CBC_SHA,
    CipherSuite::RSA_WITH_AES_128_CBC_SHA256,
    CipherSuite::RSA_WITH_AES_256_CBC_SHA256
};

// Subsystems that hold tokens and rate-limit budgets
enum class ComponentType : uint8_t {
    KERNEL,
    CPU,
    GPU,
    RAM,
    THERMAL,
    DEVICE_INTERFACES,
    SECURITY_DRIVER,
    STORAGE_DRIVER,
    OS,
    AI,
    IDENTITY,
    PERMISSIONS,
    NETWORK,
    FIREWALL,
    MESSAGING,
    CALLING,
    DISPLAY,
    AUDIO,
    POWER,
    API,
    SECURITY,
    OPTIMIZATION,
    HSM
};

// Logical traffic classes, each routed by its own loop
enum class LoopKind : uint8_t {
    KERNEL = 0,
    AI = 1,
    DEVICE = 2,
    NETWORK = 3,
    POWER = 4
};

constexpr size_t LOOP_KIND_COUNT = 5;

constexpr std::array<LoopKind, LOOP_KIND_COUNT> ALL_LOOP_KINDS = {
    LoopKind::KERNEL, LoopKind::AI, LoopKind::DEVICE, LoopKind::NETWORK, LoopKind::POWER
};

enum class ConnectionRole : uint8_t {
    CLIENT,
    SERVER
};

enum class HandshakeState : uint8_t {
    INITIAL,
    CLIENT_HELLO_SENT,
    SERVER_HELLO_RECEIVED,
    CERTIFICATE_RECEIVED,
    CLIENT_KEY_EXCHANGE_SENT,
    FINISHED
};

enum class SessionState : uint8_t {
    CONFIGURED,
    HANDSHAKING,
    ESTABLISHED,
    FAILED,
    CLOSED
};

// Hardware commands reachable through the kernel loop
enum class HardwareCommand : uint8_t {
    GET_CPU_STATUS,
    GET_GPU_STATUS,
    GET_RAM_STATUS,
    GET_THERMAL_STATUS,
    GET_POWER_STATUS,
    SET_CPU_FREQ,
    SET_GPU_FREQ,
    SET_THERMAL_THROTTLE,
    SET_DISPLAY_BRIGHTNESS,
    RECOVER_COMPONENT,
    HARDWARE_HEALTH_POLL
};

SBUS_API bool is_supported_cipher_suite(uint16_t suite);

SBUS_API std::string to_string(ComponentType component);
SBUS_API std::string to_string(LoopKind kind);
SBUS_API std::string to_string(HandshakeState state);
SBUS_API std::string to_string(SessionState state);
SBUS_API std::string to_string(HardwareCommand command);
SBUS_API std::string to_string(ConnectionRole role);

SBUS_API std::optional<ComponentType> component_from_string(const std::string& name);
SBUS_API std::optional<HardwareCommand> hardware_command_from_string(const std::string& name);

} // namespace v1
} // namespace sbus

#endif // SBUS_TYPES_H
