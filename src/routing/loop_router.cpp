#include <sbus/routing/loop_router.h>
#include <sbus/crypto/crypto_utils.h>
#include <algorithm>

namespace sbus {
namespace v1 {
namespace routing {

namespace {

Bytes routing_aad(const std::string& from, const std::string& to) {
    return crypto::utils::to_bytes(from + "|" + to);
}

} // namespace

// LoopChannel

LoopChannel::LoopChannel(std::shared_ptr<LoopRouter> router, LoopKind kind, std::string node)
    : router_(std::move(router))
    , kind_(kind)
    , node_(std::move(node)) {}

bool LoopChannel::send(const std::string& destination, const Bytes& payload, const std::string& token) {
    auto result = router_->send_message(kind_, node_, destination, payload, token);
    last_error_ = result ? SBusError::SUCCESS : result.error();
    return result.is_success();
}

std::optional<Bytes> LoopChannel::receive() {
    auto result = router_->receive(kind_, node_);
    if (!result) {
        last_error_ = result.error();
        return std::nullopt;
    }
    return std::move(*result);
}

// LoopRouter

const std::vector<ComponentType>& LoopRouter::permitted_components(LoopKind kind) {
    static const std::vector<ComponentType> kernel = {
        ComponentType::KERNEL, ComponentType::CPU, ComponentType::GPU,
        ComponentType::RAM, ComponentType::THERMAL
    };
    static const std::vector<ComponentType> ai = {
        ComponentType::OS, ComponentType::AI
    };
    static const std::vector<ComponentType> device = {
        ComponentType::DEVICE_INTERFACES, ComponentType::STORAGE_DRIVER,
        ComponentType::SECURITY_DRIVER, ComponentType::DISPLAY, ComponentType::AUDIO
    };
    static const std::vector<ComponentType> network = {
        ComponentType::NETWORK, ComponentType::MESSAGING, ComponentType::CALLING
    };
    static const std::vector<ComponentType> power = {
        ComponentType::POWER
    };

    switch (kind) {
        case LoopKind::KERNEL: return kernel;
        case LoopKind::AI: return ai;
        case LoopKind::DEVICE: return device;
        case LoopKind::NETWORK: return network;
        case LoopKind::POWER: return power;
    }
    return kernel;
}

Result<std::shared_ptr<LoopRouter>> LoopRouter::create(
    std::shared_ptr<BusContext> context,
    std::shared_ptr<auth::ComponentTokenManager> tokens,
    std::shared_ptr<device::HardwareCommandQueue> hardware,
    std::shared_ptr<security::AnomalyDetector> anomalies,
    std::shared_ptr<security::Honeypot> honeypot) {

    if (!context || !tokens) {
        return make_error<std::shared_ptr<LoopRouter>>(SBusError::INVALID_PARAMETER,
                                                       "loop router needs a context and a token manager");
    }

    std::shared_ptr<LoopRouter> router(new LoopRouter(context, std::move(tokens), std::move(hardware),
                                                      std::move(anomalies), std::move(honeypot)));

    for (auto kind : ALL_LOOP_KINDS) {
        auto key = SBUS_TRY(crypto::CryptoKey::create(context->crypto(), context->config().master_key,
                                                      "loop/" + to_string(kind)));
        router->loops_[static_cast<size_t>(kind)] = std::make_unique<Loop>(std::move(key));
    }
    return router;
}

LoopRouter::LoopRouter(std::shared_ptr<BusContext> context,
                       std::shared_ptr<auth::ComponentTokenManager> tokens,
                       std::shared_ptr<device::HardwareCommandQueue> hardware,
                       std::shared_ptr<security::AnomalyDetector> anomalies,
                       std::shared_ptr<security::Honeypot> honeypot)
    : context_(std::move(context))
    , tokens_(std::move(tokens))
    , hardware_(std::move(hardware))
    , anomalies_(std::move(anomalies))
    , honeypot_(std::move(honeypot))
    , guard_(context_->config().routing.critical_action_cooldown, context_->clock()) {}

Result<void> LoopRouter::check_sandbox(LoopKind kind) {
    auto active = context_->sandboxes().check(kind);
    if (!active) {
        Loop& target = loop(kind);
        std::lock_guard<std::mutex> lock(target.mutex);
        target.stats.sandbox_rejections++;
    }
    return active;
}

void LoopRouter::signal_intrusion(LoopKind kind, const std::string& source, const std::string& reason) {
    const std::string where = to_string(kind) + " loop: " + reason;
    if (anomalies_) {
        anomalies_->record_authorization_failure(source, where);
    }
    if (honeypot_) {
        auto signalled = honeypot_->signal_attempt(source, where);
        if (!signalled) {
            SBUS_REPORT_WARNING(context_->reporter(), signalled.error(),
                                "honeypot could not record attempt: " + signalled.error_detail());
        }
    }
}

Result<auth::ComponentToken> LoopRouter::authorize(LoopKind kind, const std::string& source,
                                                   const std::string& token) {
    auto refuse = [&](SBusError error, const std::string& reason) -> Result<auth::ComponentToken> {
        {
            Loop& target = loop(kind);
            std::lock_guard<std::mutex> lock(target.mutex);
            target.stats.authorization_failures++;
        }
        signal_intrusion(kind, source, reason);
        return make_error<auth::ComponentToken>(error, reason);
    };

    if (honeypot_ && honeypot_->is_decoy(token)) {
        return refuse(SBusError::INVALID_TOKEN, "decoy token presented");
    }

    auto validated = tokens_->validate_token_value(token);
    if (!validated) {
        return refuse(validated.error(), validated.error_detail());
    }

    const auto& permitted = permitted_components(kind);
    if (std::find(permitted.begin(), permitted.end(), validated->component) == permitted.end()) {
        return refuse(SBusError::UNAUTHORIZED_COMPONENT,
                      to_string(validated->component) + " may not use this loop");
    }
    return validated;
}

Result<void> LoopRouter::register_node(LoopKind kind, const std::string& node) {
    if (node.empty()) {
        return Failure(SBusError::INVALID_PARAMETER, "empty node name");
    }
    SBUS_TRY_VOID(check_sandbox(kind));

    Loop& target = loop(kind);
    std::lock_guard<std::mutex> lock(target.mutex);
    target.nodes.emplace(node, std::deque<LoopMessage>{});
    return make_result();
}

Result<void> LoopRouter::unregister_node(LoopKind kind, const std::string& node) {
    Loop& target = loop(kind);
    std::lock_guard<std::mutex> lock(target.mutex);
    if (target.nodes.erase(node) == 0) {
        return Failure(SBusError::DESTINATION_NOT_FOUND, "node " + node + " not registered");
    }
    return make_result();
}

std::vector<std::string> LoopRouter::list_nodes(LoopKind kind) const {
    const Loop& target = loop(kind);
    std::lock_guard<std::mutex> lock(target.mutex);
    std::vector<std::string> nodes;
    nodes.reserve(target.nodes.size());
    for (const auto& entry : target.nodes) {
        nodes.push_back(entry.first);
    }
    return nodes;
}

Result<void> LoopRouter::send_message(LoopKind kind,
                                      const std::string& from,
                                      const std::string& to,
                                      const Bytes& payload,
                                      const std::string& token) {
    SBUS_TRY_VOID(check_sandbox(kind));
    if (payload.empty()) {
        return Failure(SBusError::EMPTY_PAYLOAD, "empty loop message");
    }
    SBUS_TRY_VOID(authorize(kind, from, token));

    Loop& target = loop(kind);
    bool known = false;
    {
        std::lock_guard<std::mutex> lock(target.mutex);
        known = target.nodes.count(to) != 0;
        if (!known) {
            target.stats.unknown_destinations++;
        }
    }
    if (!known) {
        signal_intrusion(kind, from, "unknown destination " + to);
        return Failure(SBusError::DESTINATION_NOT_FOUND, "node " + to + " not registered");
    }

    LoopMessage message;
    message.from = from;
    message.to = to;
    message.sealed = SBUS_TRY(target.key.encrypt_raw(payload, routing_aad(from, to)));
    message.queued_at = context_->clock()->now();

    std::lock_guard<std::mutex> lock(target.mutex);
    auto it = target.nodes.find(to);
    if (it == target.nodes.end()) {
        return Failure(SBusError::DESTINATION_NOT_FOUND, "node " + to + " unregistered");
    }
    if (it->second.size() >= context_->config().routing.node_queue_capacity) {
        target.stats.queue_overflows++;
        return Failure(SBusError::QUEUE_FULL, "inbound queue of " + to + " is full");
    }
    it->second.push_back(std::move(message));
    target.stats.messages_routed++;
    return make_result();
}

Result<Bytes> LoopRouter::receive(LoopKind kind, const std::string& node) {
    SBUS_TRY_VOID(check_sandbox(kind));

    Loop& target = loop(kind);
    LoopMessage message;
    {
        std::lock_guard<std::mutex> lock(target.mutex);
        auto it = target.nodes.find(node);
        if (it == target.nodes.end()) {
            return make_error<Bytes>(SBusError::DESTINATION_NOT_FOUND, "node " + node + " not registered");
        }
        if (it->second.empty()) {
            return make_error<Bytes>(SBusError::QUEUE_EMPTY, "nothing queued for " + node);
        }
        message = std::move(it->second.front());
        it->second.pop_front();
    }

    auto opened = target.key.decrypt_raw(message.sealed, routing_aad(message.from, message.to));
    if (opened) {
        std::lock_guard<std::mutex> lock(target.mutex);
        target.stats.messages_delivered++;
    }
    return opened;
}

size_t LoopRouter::pending(LoopKind kind, const std::string& node) const {
    const Loop& target = loop(kind);
    std::lock_guard<std::mutex> lock(target.mutex);
    auto it = target.nodes.find(node);
    return it == target.nodes.end() ? 0 : it->second.size();
}

std::shared_ptr<LoopChannel> LoopRouter::channel(LoopKind kind, const std::string& node) {
    return std::make_shared<LoopChannel>(shared_from_this(), kind, node);
}

Result<device::RequestId> LoopRouter::execute_hardware_command(HardwareCommand command,
                                                               const Bytes& params,
                                                               const std::string& token) {
    SBUS_TRY_VOID(check_sandbox(LoopKind::KERNEL));
    SBUS_TRY_VOID(authorize(LoopKind::KERNEL, HARDWARE_SOURCE, token));

    if (!hardware_) {
        return make_error<device::RequestId>(SBusError::NOT_INITIALIZED, "no hardware queue attached");
    }

    auto allowed = guard_.check_and_record(command);
    if (!allowed) {
        SBUS_REPORT_WARNING(context_->reporter(), allowed.error(),
                            to_string(command) + " refused: " + allowed.error_detail());
        return allowed.failure();
    }

    return hardware_->enqueue_request(command, params, context_->config().hardware_queue.default_timeout);
}

Result<bool> LoopRouter::trigger_health_poll(Timestamp now) {
    std::lock_guard<std::mutex> lock(poll_mutex_);
    if (last_health_poll_ && now - *last_health_poll_ < context_->config().routing.health_poll_interval) {
        return false;
    }
    last_health_poll_ = now;

    if (hardware_) {
        SBUS_TRY_VOID(hardware_->enqueue_request(HardwareCommand::HARDWARE_HEALTH_POLL, Bytes{},
                                                 context_->config().hardware_queue.default_timeout));
    }
    return true;
}

LoopStats LoopRouter::stats(LoopKind kind) const {
    const Loop& target = loop(kind);
    std::lock_guard<std::mutex> lock(target.mutex);
    return target.stats;
}

} // namespace routing
} // namespace v1
} // namespace sbus
