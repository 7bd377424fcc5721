#include <sbus/routing/sandbox.h>

namespace sbus {
namespace v1 {
namespace routing {

SandboxHandle::SandboxHandle(SandboxId id, std::string name, SandboxLimits limits, SandboxPolicy policy)
    : id_(id)
    , name_(std::move(name))
    , limits_(limits)
    , policy_(policy) {}

Result<void> SandboxHandle::check_memory(uint64_t bytes) const {
    if (bytes > memory_quota_bytes()) {
        return Failure(SBusError::QUOTA_EXCEEDED, name_ + ": memory quota");
    }
    return make_result();
}

Result<void> SandboxHandle::check_file_descriptors(uint32_t count) const {
    if (count > limits_.max_file_descriptors) {
        return Failure(SBusError::QUOTA_EXCEEDED, name_ + ": file descriptor quota");
    }
    return make_result();
}

Result<void> SandboxHandle::check_cpu(uint32_t percent) const {
    if (percent > limits_.max_cpu_percent) {
        return Failure(SBusError::QUOTA_EXCEEDED, name_ + ": cpu quota");
    }
    return make_result();
}

Result<void> SandboxHandle::check_syscall_count(uint32_t count) const {
    if (count > limits_.allowed_syscalls) {
        return Failure(SBusError::QUOTA_EXCEEDED, name_ + ": syscall allowance");
    }
    return make_result();
}

bool SandboxHandle::permits(SandboxCapability capability) const {
    switch (capability) {
        case SandboxCapability::NETWORK: return policy_.allow_network;
        case SandboxCapability::FILESYSTEM: return policy_.allow_filesystem;
        case SandboxCapability::IPC: return policy_.allow_ipc;
        case SandboxCapability::SIGNALS: return policy_.allow_signals;
    }
    return false;
}

std::shared_ptr<SandboxHandle> SandboxManager::create_sandbox(const std::string& name,
                                                              const SandboxLimits& limits,
                                                              const SandboxPolicy& policy) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    SandboxId id = next_id_++;
    auto handle = std::make_shared<SandboxHandle>(id, name, limits, policy);
    sandboxes_[id] = handle;
    return handle;
}

std::shared_ptr<SandboxHandle> SandboxManager::get_sandbox(SandboxId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sandboxes_.find(id);
    if (it == sandboxes_.end()) {
        return nullptr;
    }
    return it->second;
}

Result<void> SandboxManager::destroy_sandbox(SandboxId id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sandboxes_.find(id);
    if (it == sandboxes_.end()) {
        return Failure(SBusError::SANDBOX_NOT_FOUND, "sandbox " + std::to_string(id));
    }
    it->second->deactivate();
    sandboxes_.erase(it);
    return make_result();
}

size_t SandboxManager::sandbox_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sandboxes_.size();
}

size_t SandboxManager::active_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : sandboxes_) {
        if (entry.second->is_active()) {
            ++count;
        }
    }
    return count;
}

void SandboxRegistry::set_loop_active(LoopKind kind, bool active) {
    loop_active_[static_cast<size_t>(kind)].store(active);
}

bool SandboxRegistry::is_loop_active(LoopKind kind) const {
    return loop_active_[static_cast<size_t>(kind)].load();
}

Result<void> SandboxRegistry::check(LoopKind kind) const {
    if (!is_transport_active()) {
        return Failure(SBusError::SANDBOX_INACTIVE, "transport sandbox inactive");
    }
    if (!is_loop_active(kind)) {
        return Failure(SBusError::SANDBOX_INACTIVE, to_string(kind) + " loop sandbox inactive");
    }
    return make_result();
}

void SandboxRegistry::activate_all() {
    transport_active_.store(true);
    for (auto& flag : loop_active_) {
        flag.store(true);
    }
}

void SandboxRegistry::deactivate_all() {
    transport_active_.store(false);
    for (auto& flag : loop_active_) {
        flag.store(false);
    }
}

} // namespace routing
} // namespace v1
} // namespace sbus
