#include <sbus/types.h>
#include <algorithm>
#include <sstream>
#include <unordered_map>

namespace sbus {
namespace v1 {

namespace {

const std::unordered_map<ComponentType, std::string>& component_names() {
    static const std::unordered_map<ComponentType, std::string> names = {
        {ComponentType::KERNEL, "kernel"},
        {ComponentType::CPU, "cpu"},
        {ComponentType::GPU, "gpu"},
        {ComponentType::RAM, "ram"},
        {ComponentType::THERMAL, "thermal"},
        {ComponentType::DEVICE_INTERFACES, "device_interfaces"},
        {ComponentType::SECURITY_DRIVER, "security_driver"},
        {ComponentType::STORAGE_DRIVER, "storage_driver"},
        {ComponentType::OS, "os"},
        {ComponentType::AI, "ai"},
        {ComponentType::IDENTITY, "identity"},
        {ComponentType::PERMISSIONS, "permissions"},
        {ComponentType::NETWORK, "network"},
        {ComponentType::FIREWALL, "firewall"},
        {ComponentType::MESSAGING, "messaging"},
        {ComponentType::CALLING, "calling"},
        {ComponentType::DISPLAY, "display"},
        {ComponentType::AUDIO, "audio"},
        {ComponentType::POWER, "power"},
        {ComponentType::API, "api"},
        {ComponentType::SECURITY, "security"},
        {ComponentType::OPTIMIZATION, "optimization"},
        {ComponentType::HSM, "hsm"}
    };
    return names;
}

const std::unordered_map<HardwareCommand, std::string>& command_names() {
    static const std::unordered_map<HardwareCommand, std::string> names = {
        {HardwareCommand::GET_CPU_STATUS, "GetCpuStatus"},
        {HardwareCommand::GET_GPU_STATUS, "GetGpuStatus"},
        {HardwareCommand::GET_RAM_STATUS, "GetRamStatus"},
        {HardwareCommand::GET_THERMAL_STATUS, "GetThermalStatus"},
        {HardwareCommand::GET_POWER_STATUS, "GetPowerStatus"},
        {HardwareCommand::SET_CPU_FREQ, "SetCpuFreq"},
        {HardwareCommand::SET_GPU_FREQ, "SetGpuFreq"},
        {HardwareCommand::SET_THERMAL_THROTTLE, "SetThermalThrottle"},
        {HardwareCommand::SET_DISPLAY_BRIGHTNESS, "SetDisplayBrightness"},
        {HardwareCommand::RECOVER_COMPONENT, "RecoverComponent"},
        {HardwareCommand::HARDWARE_HEALTH_POLL, "HardwareHealthPoll"}
    };
    return names;
}

} // namespace

bool is_supported_cipher_suite(uint16_t suite) {
    return std::any_of(SUPPORTED_CIPHER_SUITES.begin(), SUPPORTED_CIPHER_SUITES.end(),
                       [suite](CipherSuite s) { return static_cast<uint16_t>(s) == suite; });
}

std::string to_string(ComponentType component) {
    auto it = component_names().find(component);
    if (it != component_names().end()) {
        return it->second;
    }

    std::ostringstream oss;
    oss << "component(" << static_cast<int>(component) << ")";
    return oss.str();
}

std::string to_string(LoopKind kind) {
    switch (kind) {
        case LoopKind::KERNEL: return "kernel";
        case LoopKind::AI: return "ai";
        case LoopKind::DEVICE: return "device";
        case LoopKind::NETWORK: return "network";
        case LoopKind::POWER: return "power";
    }
    return "unknown";
}

std::string to_string(HandshakeState state) {
    switch (state) {
        case HandshakeState::INITIAL: return "INITIAL";
        case HandshakeState::CLIENT_HELLO_SENT: return "CLIENT_HELLO_SENT";
        case HandshakeState::SERVER_HELLO_RECEIVED: return "SERVER_HELLO_RECEIVED";
        case HandshakeState::CERTIFICATE_RECEIVED: return "CERTIFICATE_RECEIVED";
        case HandshakeState::CLIENT_KEY_EXCHANGE_SENT: return "CLIENT_KEY_EXCHANGE_SENT";
        case HandshakeState::FINISHED: return "FINISHED";
    }
    return "UNKNOWN";
}

std::string to_string(SessionState state) {
    switch (state) {
        case SessionState::CONFIGURED: return "CONFIGURED";
        case SessionState::HANDSHAKING: return "HANDSHAKING";
        case SessionState::ESTABLISHED: return "ESTABLISHED";
        case SessionState::FAILED: return "FAILED";
        case SessionState::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

std::string to_string(HardwareCommand command) {
    auto it = command_names().find(command);
    if (it != command_names().end()) {
        return it->second;
    }
    return "UnknownCommand";
}

std::string to_string(ConnectionRole role) {
    return role == ConnectionRole::CLIENT ? "client" : "server";
}

std::optional<ComponentType> component_from_string(const std::string& name) {
    for (const auto& entry : component_names()) {
        if (entry.second == name) {
            return entry.first;
        }
    }
    return std::nullopt;
}

std::optional<HardwareCommand> hardware_command_from_string(const std::string& name) {
    for (const auto& entry : command_names()) {
        if (entry.second == name) {
            return entry.first;
        }
    }
    return std::nullopt;
}

} // namespace v1
} // namespace sbus
