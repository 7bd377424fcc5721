#include <gtest/gtest.h>
#include <sbus/types.h>
#include <set>
#include <string>

using namespace sbus::v1;

class TypesTest : public ::testing::Test {};

TEST_F(TypesTest, ComponentNamesRoundTrip) {
    EXPECT_EQ(to_string(ComponentType::KERNEL), "kernel");
    EXPECT_EQ(to_string(ComponentType::DEVICE_INTERFACES), "device_interfaces");
    EXPECT_EQ(to_string(ComponentType::HSM), "hsm");

    auto parsed = component_from_string("storage_driver");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, ComponentType::STORAGE_DRIVER);

    EXPECT_FALSE(component_from_string("Kernel").has_value());
    EXPECT_FALSE(component_from_string("").has_value());
}

TEST_F(TypesTest, HardwareCommandNames) {
    EXPECT_EQ(to_string(HardwareCommand::SET_CPU_FREQ), "SetCpuFreq");
    EXPECT_EQ(to_string(HardwareCommand::HARDWARE_HEALTH_POLL), "HardwareHealthPoll");

    auto parsed = hardware_command_from_string("RecoverComponent");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, HardwareCommand::RECOVER_COMPONENT);
    EXPECT_FALSE(hardware_command_from_string("Reboot").has_value());
}

TEST_F(TypesTest, LoopKinds) {
    std::set<std::string> names;
    for (LoopKind kind : ALL_LOOP_KINDS) {
        names.insert(to_string(kind));
    }
    EXPECT_EQ(names.size(), LOOP_KIND_COUNT);
    EXPECT_EQ(names.count("kernel"), 1u);
    EXPECT_EQ(names.count("power"), 1u);
}

TEST_F(TypesTest, StateNames) {
    EXPECT_EQ(to_string(SessionState::ESTABLISHED), "ESTABLISHED");
    EXPECT_EQ(to_string(HandshakeState::CLIENT_KEY_EXCHANGE_SENT), "CLIENT_KEY_EXCHANGE_SENT");
    EXPECT_EQ(to_string(ConnectionRole::CLIENT), "client");
    EXPECT_EQ(to_string(ConnectionRole::SERVER), "server");
}

TEST_F(TypesTest, SupportedCipherSuites) {
    for (CipherSuite suite : SUPPORTED_CIPHER_SUITES) {
        EXPECT_TRUE(is_supported_cipher_suite(static_cast<uint16_t>(suite)));
    }
    EXPECT_TRUE(is_supported_cipher_suite(0x002F));
    EXPECT_FALSE(is_supported_cipher_suite(0x1301));
    EXPECT_FALSE(is_supported_cipher_suite(0));
}
