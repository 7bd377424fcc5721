#include <sbus/session/session_tickets.h>
#include <sbus/crypto/crypto_utils.h>

#include <mutex>

namespace sbus {
namespace v1 {
namespace session {

SessionTicketManager::SessionTicketManager(const TicketConfig& config,
                                           crypto::CryptoKey ticket_key,
                                           std::shared_ptr<crypto::CryptoProvider> provider,
                                           std::shared_ptr<Clock> clock)
    : config_(config)
    , ticket_key_(std::move(ticket_key))
    , provider_(std::move(provider))
    , clock_(std::move(clock)) {}

Result<std::string> SessionTicketManager::create_ticket(const std::vector<uint8_t>& session_key,
                                                        const std::string& client_identity) {
    if (session_key.empty()) {
        return make_error<std::string>(SBusError::INVALID_PARAMETER, "empty session key");
    }

    auto id_bytes = SBUS_TRY(crypto::utils::generate_random(*provider_, config_.ticket_id_length));
    std::string ticket_id = crypto::utils::to_hex(id_bytes);

    StoredTicket stored;
    stored.ticket_id = ticket_id;
    stored.sealed_key = SBUS_TRY(ticket_key_.encrypt_raw(session_key, crypto::utils::to_bytes(ticket_id)));
    stored.client_identity = client_identity;
    stored.created_at = clock_->now();
    stored.lifetime = config_.lifetime;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    while (!tickets_.empty() && tickets_.size() >= config_.capacity) {
        evict_oldest_locked();
    }
    tickets_[ticket_id] = std::move(stored);
    created_++;
    return ticket_id;
}

void SessionTicketManager::evict_oldest_locked() {
    auto oldest = tickets_.begin();
    for (auto it = tickets_.begin(); it != tickets_.end(); ++it) {
        if (it->second.created_at < oldest->second.created_at) {
            oldest = it;
        }
    }
    tickets_.erase(oldest);
}

Result<SessionTicket> SessionTicketManager::open_ticket(const StoredTicket& stored) const {
    auto key = ticket_key_.decrypt_raw(stored.sealed_key, crypto::utils::to_bytes(stored.ticket_id));
    if (!key) {
        return key.failure();
    }

    SessionTicket ticket;
    ticket.ticket_id = stored.ticket_id;
    ticket.session_key = std::move(*key);
    ticket.client_identity = stored.client_identity;
    ticket.created_at = stored.created_at;
    ticket.lifetime = stored.lifetime;
    ticket.reuse_count = stored.reuse_count;
    return ticket;
}

Result<SessionTicket> SessionTicketManager::reuse_ticket(const std::string& ticket_id,
                                                         const std::string& client_identity) {
    Timestamp now = clock_->now();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = tickets_.find(ticket_id);
    if (it == tickets_.end()) {
        return make_error<SessionTicket>(SBusError::TICKET_NOT_FOUND, "unknown ticket");
    }

    if (!it->second.is_valid(now)) {
        tickets_.erase(it);
        expired_++;
        return make_error<SessionTicket>(SBusError::TICKET_NOT_FOUND, "ticket expired");
    }

    // A bound ticket is only redeemed by the identity it was issued to
    if (!it->second.client_identity.empty() &&
        !crypto::utils::constant_time_compare(client_identity, it->second.client_identity)) {
        return make_error<SessionTicket>(SBusError::AUTHENTICATION_FAILED, "ticket bound to another identity");
    }

    auto ticket = open_ticket(it->second);
    if (!ticket) {
        return ticket;
    }

    it->second.reuse_count++;
    ticket->reuse_count = it->second.reuse_count;
    reused_++;
    return ticket;
}

Result<SessionTicket> SessionTicketManager::get_ticket(const std::string& ticket_id) const {
    Timestamp now = clock_->now();

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tickets_.find(ticket_id);
    if (it == tickets_.end() || !it->second.is_valid(now)) {
        return make_error<SessionTicket>(SBusError::TICKET_NOT_FOUND, "unknown or expired ticket");
    }
    return open_ticket(it->second);
}

bool SessionTicketManager::has_valid_ticket(const std::string& ticket_id) const {
    Timestamp now = clock_->now();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tickets_.find(ticket_id);
    return it != tickets_.end() && it->second.is_valid(now);
}

bool SessionTicketManager::revoke_ticket(const std::string& ticket_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (tickets_.erase(ticket_id) == 0) {
        return false;
    }
    revoked_++;
    return true;
}

bool SessionTicketManager::update_lifetime(const std::string& ticket_id, std::chrono::seconds lifetime) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = tickets_.find(ticket_id);
    if (it == tickets_.end()) {
        return false;
    }
    it->second.lifetime = lifetime;
    return true;
}

size_t SessionTicketManager::cleanup_expired() {
    Timestamp now = clock_->now();
    std::unique_lock<std::shared_mutex> lock(mutex_);

    size_t removed = 0;
    for (auto it = tickets_.begin(); it != tickets_.end();) {
        if (!it->second.is_valid(now)) {
            it = tickets_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    expired_ += removed;
    return removed;
}

SessionTicketStats SessionTicketManager::stats() const {
    SessionTicketStats stats;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        stats.total_tickets = tickets_.size();
    }
    stats.created_count = created_.load();
    stats.reused_count = reused_.load();
    stats.expired_count = expired_.load();
    stats.revoked_count = revoked_.load();
    return stats;
}

void SessionTicketManager::clear_all() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    tickets_.clear();
}

} // namespace session
} // namespace v1
} // namespace sbus
