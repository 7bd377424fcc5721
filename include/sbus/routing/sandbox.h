#pragma once

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/bus_config.h>

#include <array>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sbus {
namespace v1 {
namespace routing {

/**
 * Capabilities granted to a sandboxed loop
 */
struct SandboxPolicy {
    bool allow_network = false;
    bool allow_filesystem = false;
    bool allow_ipc = false;
    bool allow_signals = false;

    // Operating-system services: filesystem and IPC
    static SandboxPolicy for_os() {
        return SandboxPolicy{false, true, true, false};
    }

    // Network stack: network only
    static SandboxPolicy for_network_service() {
        return SandboxPolicy{true, false, false, false};
    }

    // Drivers: IPC and signals
    static SandboxPolicy for_device_driver() {
        return SandboxPolicy{false, false, true, true};
    }
};

enum class SandboxCapability : uint8_t {
    NETWORK,
    FILESYSTEM,
    IPC,
    SIGNALS
};

using SandboxId = uint64_t;

/**
 * One sandbox: limits, policy and an active flag.
 *
 * Sandboxes start inactive. Quota checks compare a requested amount
 * against the configured limits and fail with QUOTA_EXCEEDED.
 */
class SBUS_API SandboxHandle {
public:
    SandboxHandle(SandboxId id, std::string name, SandboxLimits limits, SandboxPolicy policy);

    SandboxId id() const { return id_; }
    const std::string& name() const { return name_; }
    const SandboxLimits& limits() const { return limits_; }
    const SandboxPolicy& policy() const { return policy_; }

    void activate() { active_.store(true); }
    void deactivate() { active_.store(false); }
    bool is_active() const { return active_.load(); }

    uint64_t memory_quota_bytes() const {
        return limits_.max_memory_mb * 1024 * 1024;
    }

    Result<void> check_memory(uint64_t bytes) const;
    Result<void> check_file_descriptors(uint32_t count) const;
    Result<void> check_cpu(uint32_t percent) const;
    Result<void> check_syscall_count(uint32_t count) const;

    bool permits(SandboxCapability capability) const;

private:
    SandboxId id_;
    std::string name_;
    SandboxLimits limits_;
    SandboxPolicy policy_;
    std::atomic<bool> active_{false};
};

/**
 * Owns every sandbox. Ids start at 1.
 */
class SBUS_API SandboxManager {
public:
    SandboxManager() = default;

    std::shared_ptr<SandboxHandle> create_sandbox(const std::string& name,
                                                  const SandboxLimits& limits,
                                                  const SandboxPolicy& policy);

    std::shared_ptr<SandboxHandle> get_sandbox(SandboxId id) const;

    // Deactivates and forgets the sandbox
    Result<void> destroy_sandbox(SandboxId id);

    size_t sandbox_count() const;
    size_t active_count() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<SandboxId, std::shared_ptr<SandboxHandle>> sandboxes_;
    SandboxId next_id_ = 1;
};

/**
 * Sandbox state shared by all routing loops.
 *
 * Traffic on a loop is admitted only while both the global transport
 * sandbox and the loop's own sandbox flag are active.
 */
class SBUS_API SandboxRegistry {
public:
    SandboxRegistry() = default;

    void set_transport_active(bool active) { transport_active_.store(active); }
    bool is_transport_active() const { return transport_active_.load(); }

    void set_loop_active(LoopKind kind, bool active);
    bool is_loop_active(LoopKind kind) const;

    // SANDBOX_INACTIVE unless transport and loop flags are both set
    Result<void> check(LoopKind kind) const;

    // Activates the transport and every loop flag
    void activate_all();
    void deactivate_all();

    SandboxManager& manager() { return manager_; }
    const SandboxManager& manager() const { return manager_; }

private:
    std::atomic<bool> transport_active_{false};
    std::array<std::atomic<bool>, LOOP_KIND_COUNT> loop_active_{};
    SandboxManager manager_;
};

} // namespace routing
} // namespace v1
} // namespace sbus
